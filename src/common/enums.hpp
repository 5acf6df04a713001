#pragma once

namespace clusterstat {

enum class EndpointKind {
    Metrics,
    Entities,
    Masters,
    TabletServers,
    Versions,
    Vars,
    NodeExporter,
    Statements,
    Threads,
    Gflags,
    ClusterConfig,
    HealthCheck,
    Drives,
    TabletServerOperations,
    MasterTasks,
    TableDetail,
    TabletDetail,
    Logs,
    Rpcs,
    Clocks
};

enum class RecordShape {
    Metric,
    Structured
};

// How the HTTP body of an endpoint is turned into rows.
enum class PayloadFormat {
    JsonObject,
    JsonRows,
    JsonMap,
    JsonSections,
    JsonFlatten,
    YbMetrics,
    YsqlStatements,
    PrometheusText,
    HtmlTable,
    GflagLines,
    GlogLines
};

enum class ChangeType {
    Added,
    Removed,
    Changed
};

} // namespace clusterstat

#include "common/kind_registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace clusterstat {

const std::vector<std::string> kEnvelopeColumns = {
    "hostname_port",
    "timestamp",
    "synthetic",
};

const std::vector<std::string> kMetricColumns = {
    "metric_type",
    "metric_id",
    "attribute_namespace",
    "attribute_table_name",
    "metric_name",
    "metric_value",
    "metric_kind",
};

namespace {

constexpr int kMasterPort = 7000;
constexpr int kTServerPort = 9000;
constexpr int kYcqlPort = 12000;
constexpr int kYsqlPort = 13000;
constexpr int kNodeExporterPort = 9300;

const std::vector<std::string> kMetricKeyColumns = {
    "metric_type",
    "metric_id",
    "metric_name",
};

std::vector<std::string> columnNames(const std::vector<ColumnSource> &columns)
{
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto &column : columns) {
        names.push_back(column.name);
    }
    return names;
}

KindSchema metricSchema(EndpointKind kind, std::string name, std::string path,
                        std::vector<int> ports, PayloadFormat format,
                        std::string description)
{
    return KindSchema{kind,
                      std::move(name),
                      std::move(path),
                      std::move(ports),
                      format,
                      RecordShape::Metric,
                      kMetricColumns,
                      kMetricKeyColumns,
                      {},
                      std::move(description)};
}

KindSchema jsonSchema(EndpointKind kind, std::string name, std::string path,
                      std::vector<int> ports, PayloadFormat format,
                      RowSource source, std::vector<std::string> keyColumns,
                      std::string description)
{
    std::vector<std::string> columns = columnNames(source.columns);
    if (format == PayloadFormat::JsonMap) {
        columns.insert(columns.begin(), "server");
    }
    return KindSchema{kind,
                      std::move(name),
                      std::move(path),
                      std::move(ports),
                      format,
                      RecordShape::Structured,
                      std::move(columns),
                      std::move(keyColumns),
                      {std::move(source)},
                      std::move(description)};
}

KindSchema sectionSchema(EndpointKind kind, std::string name, std::string path,
                         std::vector<int> ports, std::vector<RowSource> sources,
                         std::vector<std::string> keyColumns,
                         std::string description)
{
    // The column set is the union of all sections, in first-seen order.
    std::vector<std::string> columns = {"section"};
    for (const auto &source : sources) {
        for (const auto &column : source.columns) {
            if (std::find(columns.begin(), columns.end(), column.name) == columns.end()) {
                columns.push_back(column.name);
            }
        }
    }
    return KindSchema{kind,
                      std::move(name),
                      std::move(path),
                      std::move(ports),
                      PayloadFormat::JsonSections,
                      RecordShape::Structured,
                      std::move(columns),
                      std::move(keyColumns),
                      std::move(sources),
                      std::move(description)};
}

KindSchema plainSchema(EndpointKind kind, std::string name, std::string path,
                       std::vector<int> ports, PayloadFormat format,
                       std::vector<std::string> columns,
                       std::vector<std::string> keyColumns,
                       std::string description)
{
    return KindSchema{kind,
                      std::move(name),
                      std::move(path),
                      std::move(ports),
                      format,
                      RecordShape::Structured,
                      std::move(columns),
                      std::move(keyColumns),
                      {},
                      std::move(description)};
}

std::vector<KindSchema> buildSchemas()
{
    const std::vector<int> serverPorts = {kMasterPort, kTServerPort, kYcqlPort, kYsqlPort};
    const std::vector<int> masterAndTServer = {kMasterPort, kTServerPort};

    std::vector<KindSchema> schemas;

    schemas.push_back(metricSchema(
        EndpointKind::Metrics, "metrics", "/metrics?include_schema=1", serverPorts,
        PayloadFormat::YbMetrics, "Server, table, tablet and cdc metrics"));

    schemas.push_back(sectionSchema(
        EndpointKind::Entities, "entities", "/dump-entities", {kMasterPort},
        {
            RowSource{"keyspace", "/keyspaces",
                      {{"id", "/keyspace_id"},
                       {"name", "/keyspace_name"},
                       {"type", "/keyspace_type"}}},
            RowSource{"table", "/tables",
                      {{"id", "/table_id"},
                       {"name", "/table_name"},
                       {"keyspace_id", "/keyspace_id"},
                       {"state", "/state"}}},
            RowSource{"tablet", "/tablets",
                      {{"id", "/tablet_id"},
                       {"table_id", "/table_id"},
                       {"state", "/state"},
                       {"leader", "/leader"},
                       {"replicas", "/replicas"}}},
        },
        {"section", "id"}, "Keyspaces, tables and tablets known to the master"));

    schemas.push_back(jsonSchema(
        EndpointKind::Masters, "masters", "/api/v1/masters", {kMasterPort},
        PayloadFormat::JsonRows,
        RowSource{"", "/masters",
                  {{"permanent_uuid", "/instance_id/permanent_uuid"},
                   {"instance_seqno", "/instance_id/instance_seqno"},
                   {"start_time_us", "/instance_id/start_time_us"},
                   {"private_rpc_addresses", "/registration/private_rpc_addresses"},
                   {"http_addresses", "/registration/http_addresses"},
                   {"placement_cloud", "/registration/cloud_info/placement_cloud"},
                   {"placement_region", "/registration/cloud_info/placement_region"},
                   {"placement_zone", "/registration/cloud_info/placement_zone"},
                   {"role", "/role"},
                   {"error", "/error"}}},
        {"permanent_uuid"}, "Master servers and their raft roles"));

    schemas.push_back(jsonSchema(
        EndpointKind::TabletServers, "tablet-servers", "/api/v1/tablet-servers",
        {kMasterPort}, PayloadFormat::JsonMap,
        RowSource{"", "",
                  {{"status", "/status"},
                   {"permanent_uuid", "/permanent_uuid"},
                   {"cloud", "/cloud"},
                   {"region", "/region"},
                   {"zone", "/zone"},
                   {"user_tablets_total", "/user_tablets_total"},
                   {"user_tablets_leaders", "/user_tablets_leaders"},
                   {"system_tablets_total", "/system_tablets_total"},
                   {"system_tablets_leaders", "/system_tablets_leaders"},
                   {"active_tablets", "/active_tablets"}}},
        {"server"}, "Tablet servers as seen by the master"));

    schemas.push_back(jsonSchema(
        EndpointKind::Versions, "versions", "/api/v1/version", masterAndTServer,
        PayloadFormat::JsonObject,
        RowSource{"", "",
                  {{"git_hash", "/git_hash"},
                   {"build_hostname", "/build_hostname"},
                   {"build_timestamp", "/build_timestamp"},
                   {"build_username", "/build_username"},
                   {"build_clean_repo", "/build_clean_repo"},
                   {"build_id", "/build_id"},
                   {"build_type", "/build_type"},
                   {"version_number", "/version_number"},
                   {"build_number", "/build_number"}}},
        {}, "Server software version"));

    schemas.push_back(jsonSchema(
        EndpointKind::Vars, "vars", "/api/v1/varz", masterAndTServer,
        PayloadFormat::JsonRows,
        RowSource{"", "/flags",
                  {{"name", "/name"}, {"value", "/value"}, {"type", "/type"}}},
        {"name"}, "Runtime flags with their origin"));

    schemas.push_back(metricSchema(
        EndpointKind::NodeExporter, "node-exporter", "/metrics", {kNodeExporterPort},
        PayloadFormat::PrometheusText, "Operating system statistics from node_exporter"));

    schemas.push_back(metricSchema(
        EndpointKind::Statements, "statements", "/statements", {kYsqlPort},
        PayloadFormat::YsqlStatements, "YSQL pg_stat_statements counters"));

    schemas.push_back(plainSchema(
        EndpointKind::Threads, "threads", "/threadz?group=all", masterAndTServer,
        PayloadFormat::HtmlTable,
        {"thread_name", "cumulative_user_cpu_s", "cumulative_kernel_cpu_s",
         "cumulative_iowait_cpu_s"},
        {"thread_name"}, "Threads and their cumulative cpu usage"));

    schemas.push_back(plainSchema(
        EndpointKind::Gflags, "gflags", "/varz?raw", masterAndTServer,
        PayloadFormat::GflagLines, {"name", "value"}, {"name"},
        "Command line flags"));

    schemas.push_back(plainSchema(
        EndpointKind::ClusterConfig, "cluster-config", "/api/v1/cluster-config",
        {kMasterPort}, PayloadFormat::JsonFlatten, {"path", "value"}, {"path"},
        "Cluster configuration"));

    schemas.push_back(plainSchema(
        EndpointKind::HealthCheck, "health-check", "/api/v1/health-check",
        {kMasterPort}, PayloadFormat::JsonFlatten, {"path", "value"}, {"path"},
        "Master health check"));

    schemas.push_back(plainSchema(
        EndpointKind::Drives, "drives", "/drives?raw", masterAndTServer,
        PayloadFormat::HtmlTable, {"path", "used_space", "total_space"}, {"path"},
        "Data drive usage"));

    schemas.push_back(plainSchema(
        EndpointKind::TabletServerOperations, "tablet-server-operations",
        "/operations?raw", {kTServerPort}, PayloadFormat::HtmlTable,
        {"tablet_id", "op_id", "transaction_type", "total_time_in_flight", "description"},
        {"tablet_id", "op_id"}, "In-flight tablet server operations"));

    schemas.push_back(plainSchema(
        EndpointKind::MasterTasks, "master-tasks", "/tasks?raw", {kMasterPort},
        PayloadFormat::HtmlTable,
        {"task_name", "state", "start_time", "duration", "description"},
        {"task_name", "state", "start_time"}, "Master background tasks"));

    schemas.push_back(plainSchema(
        EndpointKind::TableDetail, "table-detail", "/table?id={uuid}", {kMasterPort},
        PayloadFormat::HtmlTable, {"column", "id", "type"}, {"column"},
        "Schema of one table"));

    schemas.push_back(plainSchema(
        EndpointKind::TabletDetail, "tablet-detail", "/tablet?id={uuid}",
        {kTServerPort}, PayloadFormat::HtmlTable, {"column", "id", "type"},
        {"column"}, "Schema of one tablet"));

    schemas.push_back(plainSchema(
        EndpointKind::Logs, "logs", "/logs?raw", masterAndTServer,
        PayloadFormat::GlogLines,
        {"severity", "timestamp", "tid", "source", "message"},
        {"timestamp", "tid", "source", "message"}, "Recent server log lines"));

    schemas.push_back(sectionSchema(
        EndpointKind::Rpcs, "rpcs", "/rpcz", serverPorts,
        {
            RowSource{"inbound", "/inbound_connections",
                      {{"remote_ip", "/remote_ip"},
                       {"state", "/state"},
                       {"processed_call_count", "/processed_call_count"}}},
            RowSource{"outbound", "/outbound_connections",
                      {{"remote_ip", "/remote_ip"},
                       {"state", "/state"},
                       {"processed_call_count", "/processed_call_count"}}},
            RowSource{"ysql", "/connections",
                      {{"remote_ip", "/host"},
                       {"state", "/backend_status"},
                       {"db_name", "/db_name"},
                       {"backend_type", "/backend_type"},
                       {"query", "/query"}}},
        },
        {"section", "remote_ip", "state"}, "RPC and YSQL connections"));

    schemas.push_back(plainSchema(
        EndpointKind::Clocks, "clocks", "/tablet-server-clocks?raw", {kMasterPort},
        PayloadFormat::HtmlTable,
        {"server", "time_since_heartbeat", "physical_time_utc", "hybrid_time_utc",
         "heartbeat_rtt", "cloud", "region", "zone"},
        {"server"}, "Tablet server clocks as seen by the master"));

    return schemas;
}

} // namespace

const std::vector<KindSchema> &allKindSchemas()
{
    static const std::vector<KindSchema> schemas = buildSchemas();
    return schemas;
}

const KindSchema &schemaFor(EndpointKind kind)
{
    for (const auto &schema : allKindSchemas()) {
        if (schema.kind == kind) {
            return schema;
        }
    }
    throw std::logic_error("no schema registered for endpoint kind");
}

std::string toKindString(EndpointKind kind)
{
    return schemaFor(kind).name;
}

std::optional<EndpointKind> parseKindString(const std::string &value)
{
    for (const auto &schema : allKindSchemas()) {
        if (schema.name == value) {
            return schema.kind;
        }
    }
    return std::nullopt;
}

std::vector<EndpointKind> allKinds()
{
    std::vector<EndpointKind> kinds;
    for (const auto &schema : allKindSchemas()) {
        kinds.push_back(schema.kind);
    }
    return kinds;
}

} // namespace clusterstat

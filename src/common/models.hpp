#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace clusterstat {

// One (host, port) pair to fetch a kind from.
struct Endpoint {
    std::string host;
    int port = 0;

    std::string hostnamePort() const
    {
        return host + ":" + std::to_string(port);
    }
};

struct StoredRecord {
    std::string hostnamePort;
    std::chrono::system_clock::time_point timestamp;
    // Set when the host was unreachable or its payload could not be parsed.
    // All kind-specific fields are empty in that case.
    bool synthetic = false;
    std::map<std::string, std::string> fields;
};

// All records of one kind captured in one pass.
struct RecordSet {
    EndpointKind kind = EndpointKind::Metrics;
    std::chrono::system_clock::time_point timestamp;
    std::vector<StoredRecord> records;
};

struct CatalogEntry {
    int number = 0;
    std::chrono::system_clock::time_point timestamp;
    std::string comment;
};

struct MetricDiffRow {
    std::string hostnamePort;
    std::string metricType;
    std::string metricId;
    std::string namespaceName;
    std::string tableName;
    std::string metricName;
    bool gauge = false;
    double beginValue = 0.0;
    double endValue = 0.0;
    double delta = 0.0;
    std::optional<double> rate;
};

struct StructuredDiffRow {
    struct FieldChange {
        std::string column;
        std::string before;
        std::string after;
    };

    ChangeType change = ChangeType::Changed;
    std::string hostnamePort;
    std::vector<std::pair<std::string, std::string>> key;
    std::vector<FieldChange> fields;
};

struct KindDiff {
    EndpointKind kind = EndpointKind::Metrics;
    std::chrono::system_clock::time_point beginTimestamp;
    std::chrono::system_clock::time_point endTimestamp;
    std::vector<MetricDiffRow> metricRows;
    std::vector<StructuredDiffRow> structuredRows;
    // Hosts with a synthetic record on either side; excluded from the rows.
    std::vector<std::string> unavailableHosts;
};

inline std::string fieldValue(const StoredRecord &record, const std::string &column)
{
    const auto it = record.fields.find(column);
    if (it == record.fields.end()) {
        return {};
    }
    return it->second;
}

} // namespace clusterstat

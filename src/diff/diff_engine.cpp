#include "diff/diff_engine.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <tuple>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "store/snapshot_store.hpp"

namespace clusterstat {

namespace {

// Entity types whose metrics are summed per host when details are off.
const std::set<std::string> kDetailEntityTypes = {"table", "tablet", "cdc"};

struct MetricKey {
    std::string hostnamePort;
    std::string metricType;
    std::string metricId;
    std::string metricName;

    bool operator<(const MetricKey &other) const
    {
        return std::tie(hostnamePort, metricType, metricId, metricName)
            < std::tie(other.hostnamePort, other.metricType, other.metricId, other.metricName);
    }
};

struct MetricSample {
    double value = 0.0;
    std::chrono::system_clock::time_point timestamp;
    bool gauge = false;
    std::string namespaceName;
    std::string tableName;
};

using MetricMap = std::map<MetricKey, MetricSample>;

std::set<std::string> syntheticHosts(const RecordSet &set)
{
    std::set<std::string> hosts;
    for (const auto &record : set.records) {
        if (record.synthetic) {
            hosts.insert(record.hostnamePort);
        }
    }
    return hosts;
}

std::optional<double> parseValue(const std::string &text)
{
    try {
        size_t used = 0;
        const double value = std::stod(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

MetricMap buildMetricMap(const RecordSet &set, const std::set<std::string> &excluded,
                         bool details)
{
    MetricMap map;
    for (const auto &record : set.records) {
        if (record.synthetic || excluded.count(record.hostnamePort) > 0) {
            continue;
        }
        const auto value = parseValue(fieldValue(record, "metric_value"));
        if (!value.has_value()) {
            continue;
        }

        MetricKey key{record.hostnamePort,
                      fieldValue(record, "metric_type"),
                      fieldValue(record, "metric_id"),
                      fieldValue(record, "metric_name")};
        const bool gauge = fieldValue(record, "metric_kind") == "gauge";
        const bool aggregate = !details && kDetailEntityTypes.count(key.metricType) > 0;
        if (aggregate) {
            key.metricId.clear();
        }

        auto [it, inserted] = map.try_emplace(key);
        MetricSample &sample = it->second;
        if (inserted) {
            sample.timestamp = record.timestamp;
            sample.gauge = gauge;
            if (!aggregate) {
                sample.namespaceName = fieldValue(record, "attribute_namespace");
                sample.tableName = fieldValue(record, "attribute_table_name");
            }
            sample.value = *value;
        } else if (aggregate) {
            sample.value += *value;
        }
    }
    return map;
}

void diffMetrics(const RecordSet &begin, const RecordSet &end,
                 const std::set<std::string> &excluded, const DiffOptions &options,
                 KindDiff &diff)
{
    const MetricMap beginMap = buildMetricMap(begin, excluded, options.details);
    const MetricMap endMap = buildMetricMap(end, excluded, options.details);

    for (const auto &[key, endSample] : endMap) {
        if (endSample.gauge && !options.includeGauges) {
            continue;
        }

        // A metric that appeared after begin counts up from zero.
        double beginValue = 0.0;
        auto beginTimestamp = begin.timestamp;
        const auto found = beginMap.find(key);
        if (found != beginMap.end()) {
            beginValue = found->second.value;
            beginTimestamp = found->second.timestamp;
        }

        double delta = endSample.value - beginValue;
        if (delta < 0 && !endSample.gauge) {
            // Counter reset: the server restarted in between.
            delta = endSample.value;
        }
        if (delta == 0.0 && !options.includeUnchanged) {
            continue;
        }

        MetricDiffRow row;
        row.hostnamePort = key.hostnamePort;
        row.metricType = key.metricType;
        row.metricId = key.metricId;
        row.namespaceName = endSample.namespaceName;
        row.tableName = endSample.tableName;
        row.metricName = key.metricName;
        row.gauge = endSample.gauge;
        row.beginValue = beginValue;
        row.endValue = endSample.value;
        row.delta = delta;

        const double elapsedSeconds =
            std::chrono::duration<double>(endSample.timestamp - beginTimestamp).count();
        if (elapsedSeconds > 0) {
            row.rate = delta / elapsedSeconds;
        }
        diff.metricRows.push_back(std::move(row));
    }
}

using StructuredKey = std::pair<std::string, std::vector<std::string>>;

std::map<StructuredKey, const StoredRecord *> buildStructuredMap(
    const RecordSet &set, const KindSchema &schema, const std::set<std::string> &excluded)
{
    std::map<StructuredKey, const StoredRecord *> map;
    for (const auto &record : set.records) {
        if (record.synthetic || excluded.count(record.hostnamePort) > 0) {
            continue;
        }
        std::vector<std::string> values;
        values.reserve(schema.keyColumns.size());
        for (const auto &column : schema.keyColumns) {
            values.push_back(fieldValue(record, column));
        }
        map.emplace(StructuredKey{record.hostnamePort, std::move(values)}, &record);
    }
    return map;
}

StructuredDiffRow structuredRow(ChangeType change, const KindSchema &schema,
                                const StructuredKey &key)
{
    StructuredDiffRow row;
    row.change = change;
    row.hostnamePort = key.first;
    for (size_t i = 0; i < schema.keyColumns.size(); ++i) {
        row.key.emplace_back(schema.keyColumns[i], key.second[i]);
    }
    return row;
}

void diffStructured(const RecordSet &begin, const RecordSet &end, const KindSchema &schema,
                    const std::set<std::string> &excluded, KindDiff &diff)
{
    const auto beginMap = buildStructuredMap(begin, schema, excluded);
    const auto endMap = buildStructuredMap(end, schema, excluded);

    std::set<StructuredKey> keys;
    for (const auto &item : beginMap) {
        keys.insert(item.first);
    }
    for (const auto &item : endMap) {
        keys.insert(item.first);
    }

    for (const auto &key : keys) {
        const auto before = beginMap.find(key);
        const auto after = endMap.find(key);

        if (before == beginMap.end()) {
            StructuredDiffRow row = structuredRow(ChangeType::Added, schema, key);
            for (const auto &column : schema.columns) {
                row.fields.push_back({column, std::string(), fieldValue(*after->second, column)});
            }
            diff.structuredRows.push_back(std::move(row));
            continue;
        }
        if (after == endMap.end()) {
            StructuredDiffRow row = structuredRow(ChangeType::Removed, schema, key);
            for (const auto &column : schema.columns) {
                row.fields.push_back({column, fieldValue(*before->second, column), std::string()});
            }
            diff.structuredRows.push_back(std::move(row));
            continue;
        }

        StructuredDiffRow row = structuredRow(ChangeType::Changed, schema, key);
        for (const auto &column : schema.columns) {
            const std::string beforeValue = fieldValue(*before->second, column);
            const std::string afterValue = fieldValue(*after->second, column);
            if (beforeValue != afterValue) {
                row.fields.push_back({column, beforeValue, afterValue});
            }
        }
        if (!row.fields.empty()) {
            diff.structuredRows.push_back(std::move(row));
        }
    }
}

} // namespace

KindDiff diffRecordSets(const RecordSet &begin, const RecordSet &end,
                        const DiffOptions &options)
{
    const KindSchema &schema = schemaFor(end.kind);

    KindDiff diff;
    diff.kind = end.kind;
    diff.beginTimestamp = begin.timestamp;
    diff.endTimestamp = end.timestamp;

    std::set<std::string> excluded = syntheticHosts(begin);
    const std::set<std::string> endSynthetic = syntheticHosts(end);
    excluded.insert(endSynthetic.begin(), endSynthetic.end());
    diff.unavailableHosts.assign(excluded.begin(), excluded.end());

    if (schema.shape == RecordShape::Metric) {
        diffMetrics(begin, end, excluded, options, diff);
    } else {
        diffStructured(begin, end, schema, excluded, diff);
    }
    return diff;
}

void validateDiffRequest(const SnapshotStore &store, int begin, int end)
{
    if (begin >= end) {
        throw StoreError(StoreError::Code::InvalidRequest,
                         "begin snapshot " + std::to_string(begin)
                             + " must be lower than end snapshot " + std::to_string(end));
    }
    // Both lookups throw NotFound for numbers missing from the catalog.
    store.snapshotInfo(begin);
    store.snapshotInfo(end);
}

std::vector<KindDiff> diffSnapshots(const SnapshotStore &store, int begin, int end,
                                    const std::vector<EndpointKind> &kinds,
                                    const DiffOptions &options)
{
    validateDiffRequest(store, begin, end);

    const auto beginKinds = store.availableKinds(begin);
    const auto endKinds = store.availableKinds(end);

    std::vector<KindDiff> diffs;
    for (const auto kind : kinds) {
        const bool inBoth =
            std::find(beginKinds.begin(), beginKinds.end(), kind) != beginKinds.end()
            && std::find(endKinds.begin(), endKinds.end(), kind) != endKinds.end();
        if (!inBoth) {
            CLOG_DEBUG(QStringLiteral("DiffEngine"),
                       QStringLiteral("diffSnapshots"),
                       QStringLiteral("kind_skipped"),
                       QStringLiteral("not_captured_in_both"),
                       QStringLiteral("snapshot_store"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"kind", toKindString(kind)},
                                       {"begin", begin},
                                       {"end", end}}));
            continue;
        }
        diffs.push_back(diffRecordSets(store.load(begin, kind), store.load(end, kind), options));
    }
    return diffs;
}

} // namespace clusterstat

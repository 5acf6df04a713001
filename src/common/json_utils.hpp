#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <QDateTime>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/kind_registry.hpp"
#include "common/models.hpp"

namespace clusterstat {

// ISO 8601 local time with milliseconds and utc offset,
// e.g. 2026-10-17T10:00:00.000+02:00.
inline std::string formatTimestamp(std::chrono::system_clock::time_point timestamp)
{
    const qint64 millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                              timestamp.time_since_epoch())
                              .count();
    const QDateTime local = QDateTime::fromMSecsSinceEpoch(millis);
    const QDateTime withOffset = local.toOffsetFromUtc(local.offsetFromUtc());
    return withOffset.toString(Qt::ISODateWithMs).toStdString();
}

inline std::optional<std::chrono::system_clock::time_point> parseTimestamp(
    const std::string &value)
{
    const QDateTime dt = QDateTime::fromString(QString::fromStdString(value),
                                               Qt::ISODateWithMs);
    if (!dt.isValid()) {
        return std::nullopt;
    }
    return std::chrono::system_clock::time_point{
        std::chrono::milliseconds{dt.toMSecsSinceEpoch()}};
}

// Scraped text is not guaranteed to be UTF-8; invalid bytes become U+FFFD.
inline std::string toPrettyJson(const nlohmann::json &value)
{
    return value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

inline std::string toChangeString(ChangeType change)
{
    switch (change) {
    case ChangeType::Added:
        return "added";
    case ChangeType::Removed:
        return "removed";
    case ChangeType::Changed:
        return "changed";
    }
    return "changed";
}

inline void to_json(nlohmann::json &j, const EndpointKind &kind)
{
    j = toKindString(kind);
}

inline void to_json(nlohmann::json &j, const CatalogEntry &entry)
{
    j = nlohmann::json{
        {"number", entry.number},
        {"timestamp", formatTimestamp(entry.timestamp)},
        {"comment", entry.comment}
    };
}

inline void to_json(nlohmann::json &j, const StoredRecord &record)
{
    j = nlohmann::json{
        {"hostname_port", record.hostnamePort},
        {"timestamp", formatTimestamp(record.timestamp)},
        {"synthetic", record.synthetic},
        {"fields", record.fields}
    };
}

inline void to_json(nlohmann::json &j, const MetricDiffRow &row)
{
    j = nlohmann::json{
        {"hostname_port", row.hostnamePort},
        {"metric_type", row.metricType},
        {"metric_id", row.metricId},
        {"attribute_namespace", row.namespaceName},
        {"attribute_table_name", row.tableName},
        {"metric_name", row.metricName},
        {"gauge", row.gauge},
        {"begin", row.beginValue},
        {"end", row.endValue},
        {"delta", row.delta},
        {"rate", row.rate.has_value() ? nlohmann::json(*row.rate) : nlohmann::json()}
    };
}

inline void to_json(nlohmann::json &j, const StructuredDiffRow::FieldChange &field)
{
    j = nlohmann::json{{"column", field.column}, {"before", field.before}, {"after", field.after}};
}

inline void to_json(nlohmann::json &j, const StructuredDiffRow &row)
{
    nlohmann::json key = nlohmann::json::object();
    for (const auto &[column, value] : row.key) {
        key[column] = value;
    }
    j = nlohmann::json{
        {"change", toChangeString(row.change)},
        {"hostname_port", row.hostnamePort},
        {"key", key},
        {"fields", row.fields}
    };
}

inline void to_json(nlohmann::json &j, const KindDiff &diff)
{
    j = nlohmann::json{
        {"kind", diff.kind},
        {"begin", formatTimestamp(diff.beginTimestamp)},
        {"end", formatTimestamp(diff.endTimestamp)},
        {"unavailableHosts", diff.unavailableHosts}
    };
    if (schemaFor(diff.kind).shape == RecordShape::Metric) {
        j["rows"] = diff.metricRows;
    } else {
        j["rows"] = diff.structuredRows;
    }
}

} // namespace clusterstat

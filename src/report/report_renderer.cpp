#include "report/report_renderer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <tuple>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/kind_registry.hpp"

namespace clusterstat {

namespace {

constexpr const char *kSumSuffix = ".sum";
constexpr const char *kCountSuffix = ".count";

// Count deltas of histogram ".count" rows, keyed by host, type, id and base name.
using HistogramKey = std::tuple<std::string, std::string, std::string, std::string>;
using HistogramCounts = std::map<HistogramKey, double>;

bool matches(const std::optional<std::regex> &pattern, const std::string &value)
{
    return !pattern.has_value() || std::regex_search(value, *pattern);
}

bool endsWith(const std::string &value, const std::string &suffix)
{
    return value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string formatNumber(double value)
{
    char buffer[64];
    if (std::floor(value) == value && std::fabs(value) < 1e15) {
        std::snprintf(buffer, sizeof(buffer), "%.0f", value);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.3f", value);
    }
    return buffer;
}

std::string formatRate(const std::optional<double> &rate)
{
    if (!rate.has_value()) {
        return {};
    }
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.3f", *rate);
    return buffer;
}

// One line per cell; tabs and line breaks would break the alignment.
std::string flattenCell(const std::string &value, size_t maxWidth)
{
    std::string flat;
    flat.reserve(value.size());
    for (const char c : value) {
        flat += (c == '\n' || c == '\r' || c == '\t') ? ' ' : c;
    }
    if (flat.size() > maxWidth) {
        flat.resize(maxWidth);
    }
    return flat;
}

bool structuredKeyMatches(const StructuredDiffRow &row, const std::regex &pattern)
{
    return std::any_of(row.key.begin(), row.key.end(), [&pattern](const auto &item) {
        return std::regex_search(item.second, pattern);
    });
}

bool recordMatches(const StoredRecord &record, const KindSchema &schema,
                   const ReportFilter &filter)
{
    if (!matches(filter.hostname, record.hostnamePort)) {
        return false;
    }
    if (schema.shape == RecordShape::Metric) {
        return matches(filter.statName, fieldValue(record, "metric_name"))
            && matches(filter.tableName, fieldValue(record, "attribute_table_name"));
    }
    if (!filter.statName.has_value()) {
        return true;
    }
    return std::any_of(schema.keyColumns.begin(), schema.keyColumns.end(),
                       [&](const std::string &column) {
                           return std::regex_search(fieldValue(record, column),
                                                    *filter.statName);
                       });
}

std::vector<std::string> unavailableHosts(const std::vector<std::string> &hosts,
                                          const ReportFilter &filter)
{
    std::vector<std::string> shown;
    for (const auto &host : hosts) {
        if (matches(filter.hostname, host)) {
            shown.push_back(host);
        }
    }
    return shown;
}

void renderUnavailable(std::ostream &out, const std::vector<std::string> &hosts)
{
    if (hosts.empty()) {
        return;
    }
    out << "Unavailable hosts:";
    for (size_t i = 0; i < hosts.size(); ++i) {
        out << (i == 0 ? " " : ", ") << hosts[i];
    }
    out << "\n";
}

HistogramCounts histogramCounts(const KindDiff &diff)
{
    HistogramCounts counts;
    const std::string suffix(kCountSuffix);
    for (const auto &row : diff.metricRows) {
        if (endsWith(row.metricName, suffix)) {
            counts.emplace(HistogramKey{row.hostnamePort, row.metricType, row.metricId,
                                        row.metricName.substr(0, row.metricName.size()
                                                                     - suffix.size())},
                           row.delta);
        }
    }
    return counts;
}

std::optional<double> averageFor(const HistogramCounts &counts, const MetricDiffRow &sumRow)
{
    const std::string suffix(kSumSuffix);
    if (!endsWith(sumRow.metricName, suffix)) {
        return std::nullopt;
    }
    const auto it = counts.find(
        HistogramKey{sumRow.hostnamePort, sumRow.metricType, sumRow.metricId,
                     sumRow.metricName.substr(0, sumRow.metricName.size() - suffix.size())});
    if (it == counts.end() || it->second <= 0) {
        return std::nullopt;
    }
    return sumRow.delta / it->second;
}

void renderMetricTable(std::ostream &out, const KindDiff &diff, const RenderOptions &options)
{
    std::vector<std::string> header = {"hostname_port", "metric_type"};
    if (options.details) {
        header.insert(header.end(), {"metric_id", "namespace", "table"});
    }
    header.insert(header.end(), {"metric_name", "begin", "end", "delta", "rate/s", "avg"});

    const HistogramCounts counts = histogramCounts(diff);
    std::vector<std::vector<std::string>> rows;
    for (const auto &row : diff.metricRows) {
        std::vector<std::string> cells = {row.hostnamePort, row.metricType};
        if (options.details) {
            cells.insert(cells.end(), {row.metricId, row.namespaceName, row.tableName});
        }
        const auto average = averageFor(counts, row);
        cells.insert(cells.end(),
                     {row.metricName,
                      formatNumber(row.beginValue),
                      formatNumber(row.endValue),
                      formatNumber(row.delta),
                      formatRate(row.rate),
                      average.has_value() ? formatRate(average) : std::string()});
        rows.push_back(std::move(cells));
    }
    out << formatTable(header, rows, options.maxTextWidth);
}

void renderStructuredTable(std::ostream &out, const KindDiff &diff, const KindSchema &schema,
                           const RenderOptions &options)
{
    std::vector<std::string> header = {"hostname_port", "change"};
    header.insert(header.end(), schema.keyColumns.begin(), schema.keyColumns.end());
    header.insert(header.end(), {"field", "before", "after"});

    std::vector<std::vector<std::string>> rows;
    for (const auto &row : diff.structuredRows) {
        std::vector<std::string> prefix = {row.hostnamePort, toChangeString(row.change)};
        for (const auto &item : row.key) {
            prefix.push_back(item.second);
        }

        bool emitted = false;
        for (const auto &field : row.fields) {
            const bool isKey = std::find(schema.keyColumns.begin(), schema.keyColumns.end(),
                                         field.column)
                != schema.keyColumns.end();
            if (isKey || (field.before.empty() && field.after.empty())) {
                continue;
            }
            std::vector<std::string> cells = prefix;
            cells.insert(cells.end(), {field.column, field.before, field.after});
            rows.push_back(std::move(cells));
            emitted = true;
        }
        if (!emitted) {
            std::vector<std::string> cells = prefix;
            cells.insert(cells.end(), {"", "", ""});
            rows.push_back(std::move(cells));
        }
    }
    out << formatTable(header, rows, options.maxTextWidth);
}

void renderDiffTable(std::ostream &out, const KindDiff &diff, const RenderOptions &options)
{
    const KindSchema &schema = schemaFor(diff.kind);
    out << "== " << schema.name << ": " << formatTimestamp(diff.beginTimestamp) << " -> "
        << formatTimestamp(diff.endTimestamp) << " ==\n";

    if (diff.metricRows.empty() && diff.structuredRows.empty()) {
        out << "No differences.\n";
    } else if (schema.shape == RecordShape::Metric) {
        renderMetricTable(out, diff, options);
    } else {
        renderStructuredTable(out, diff, schema, options);
    }
    renderUnavailable(out, diff.unavailableHosts);
    out << "\n";
}

nlohmann::json diffToJson(const KindDiff &diff)
{
    nlohmann::json payload = diff;
    if (schemaFor(diff.kind).shape == RecordShape::Metric) {
        const HistogramCounts counts = histogramCounts(diff);
        for (size_t i = 0; i < diff.metricRows.size(); ++i) {
            if (const auto average = averageFor(counts, diff.metricRows[i])) {
                payload["rows"][i]["average"] = *average;
            }
        }
    }
    return payload;
}

} // namespace

std::optional<OutputFormat> parseOutputFormat(const std::string &value)
{
    if (value == "table") {
        return OutputFormat::Table;
    }
    if (value == "json") {
        return OutputFormat::Json;
    }
    return std::nullopt;
}

KindDiff filterDiff(const KindDiff &diff, const ReportFilter &filter)
{
    KindDiff filtered;
    filtered.kind = diff.kind;
    filtered.beginTimestamp = diff.beginTimestamp;
    filtered.endTimestamp = diff.endTimestamp;
    filtered.unavailableHosts = unavailableHosts(diff.unavailableHosts, filter);

    for (const auto &row : diff.metricRows) {
        if (matches(filter.hostname, row.hostnamePort)
            && matches(filter.statName, row.metricName)
            && matches(filter.tableName, row.tableName)) {
            filtered.metricRows.push_back(row);
        }
    }
    for (const auto &row : diff.structuredRows) {
        if (!matches(filter.hostname, row.hostnamePort)) {
            continue;
        }
        if (filter.statName.has_value() && !structuredKeyMatches(row, *filter.statName)) {
            continue;
        }
        filtered.structuredRows.push_back(row);
    }
    return filtered;
}

std::string formatTable(const std::vector<std::string> &header,
                        const std::vector<std::vector<std::string>> &rows,
                        size_t maxWidth)
{
    std::vector<std::vector<std::string>> cells;
    cells.reserve(rows.size() + 1);
    cells.push_back(header);
    cells.insert(cells.end(), rows.begin(), rows.end());

    std::vector<size_t> widths(header.size(), 0);
    for (auto &line : cells) {
        line.resize(header.size());
        for (size_t c = 0; c < line.size(); ++c) {
            line[c] = flattenCell(line[c], maxWidth);
            widths[c] = std::max(widths[c], line[c].size());
        }
    }

    std::string text;
    for (const auto &line : cells) {
        std::string rendered;
        for (size_t c = 0; c < line.size(); ++c) {
            if (c > 0) {
                rendered += "  ";
            }
            rendered += line[c];
            if (c + 1 < line.size()) {
                rendered.append(widths[c] - line[c].size(), ' ');
            }
        }
        text += rendered + "\n";
    }
    return text;
}

std::optional<double> histogramAverage(const KindDiff &diff, const MetricDiffRow &sumRow)
{
    return averageFor(histogramCounts(diff), sumRow);
}

void renderDiffs(std::ostream &out, const std::vector<KindDiff> &diffs,
                 const RenderOptions &options)
{
    std::vector<KindDiff> filtered;
    filtered.reserve(diffs.size());
    for (const auto &diff : diffs) {
        filtered.push_back(filterDiff(diff, options.filter));
    }

    if (options.format == OutputFormat::Json) {
        nlohmann::json payload = nlohmann::json::array();
        for (const auto &diff : filtered) {
            payload.push_back(diffToJson(diff));
        }
        out << toPrettyJson(nlohmann::json{{"diffs", payload}}) << std::endl;
        return;
    }

    for (const auto &diff : filtered) {
        renderDiffTable(out, diff, options);
    }
}

void renderRecords(std::ostream &out, const RecordSet &records, const RenderOptions &options)
{
    const KindSchema &schema = schemaFor(records.kind);

    std::vector<const StoredRecord *> shown;
    std::vector<std::string> unavailable;
    for (const auto &record : records.records) {
        if (!matches(options.filter.hostname, record.hostnamePort)) {
            continue;
        }
        if (record.synthetic) {
            unavailable.push_back(record.hostnamePort);
            continue;
        }
        if (recordMatches(record, schema, options.filter)) {
            shown.push_back(&record);
        }
    }

    if (options.format == OutputFormat::Json) {
        nlohmann::json rows = nlohmann::json::array();
        for (const auto *record : shown) {
            rows.push_back(*record);
        }
        out << toPrettyJson(nlohmann::json{{"kind", records.kind},
                                           {"timestamp", formatTimestamp(records.timestamp)},
                                           {"records", rows},
                                           {"unavailableHosts", unavailable}})
            << std::endl;
        return;
    }

    std::vector<std::string> header = {"hostname_port"};
    for (const auto &column : schema.columns) {
        const bool detailColumn = column == "metric_id" || column == "attribute_namespace"
            || column == "attribute_table_name";
        if (schema.shape == RecordShape::Metric && detailColumn && !options.details) {
            continue;
        }
        header.push_back(column);
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto *record : shown) {
        std::vector<std::string> cells = {record->hostnamePort};
        for (size_t c = 1; c < header.size(); ++c) {
            cells.push_back(fieldValue(*record, header[c]));
        }
        rows.push_back(std::move(cells));
    }

    out << "== " << schema.name << ": " << formatTimestamp(records.timestamp) << " ==\n";
    if (rows.empty()) {
        out << "No records.\n";
    } else {
        out << formatTable(header, rows, options.maxTextWidth);
    }
    renderUnavailable(out, unavailable);
}

void renderCatalog(std::ostream &out, const std::vector<CatalogEntry> &entries,
                   OutputFormat format)
{
    if (format == OutputFormat::Json) {
        out << toPrettyJson(nlohmann::json{{"snapshots", entries}}) << std::endl;
        return;
    }
    if (entries.empty()) {
        out << "No snapshots.\n";
        return;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto &entry : entries) {
        rows.push_back({std::to_string(entry.number), formatTimestamp(entry.timestamp),
                        entry.comment});
    }
    out << formatTable({"number", "timestamp", "comment"}, rows, 80);
}

} // namespace clusterstat

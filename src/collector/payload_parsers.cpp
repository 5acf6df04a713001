#include "collector/payload_parsers.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace clusterstat {

namespace {

using nlohmann::json;

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::vector<std::string> splitLines(const std::string &body)
{
    std::vector<std::string> lines;
    std::istringstream stream(body);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::string jsonToText(const json &value)
{
    if (value.is_null()) {
        return {};
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    return value.dump();
}

std::optional<json> parseJson(const std::string &body)
{
    try {
        return json::parse(body);
    } catch (const json::parse_error &) {
        return std::nullopt;
    }
}

const json *resolvePointer(const json &document, const std::string &pointer)
{
    try {
        const json::json_pointer ptr(pointer);
        if (!document.contains(ptr)) {
            return nullptr;
        }
        return &document.at(ptr);
    } catch (const json::exception &) {
        return nullptr;
    }
}

PayloadRow rowFromJson(const json &element, const std::vector<ColumnSource> &columns)
{
    PayloadRow row;
    for (const auto &column : columns) {
        const json *value = resolvePointer(element, column.pointer);
        row[column.name] = value ? jsonToText(*value) : std::string();
    }
    return row;
}

PayloadRow metricRow(const std::string &type, const std::string &id,
                     const std::string &namespaceName, const std::string &tableName,
                     const std::string &name, const std::string &value, bool gauge)
{
    return PayloadRow{
        {"metric_type", type},
        {"metric_id", id},
        {"attribute_namespace", namespaceName},
        {"attribute_table_name", tableName},
        {"metric_name", name},
        {"metric_value", value},
        {"metric_kind", gauge ? "gauge" : "counter"},
    };
}

std::optional<std::vector<PayloadRow>> parseJsonObject(const KindSchema &schema,
                                                       const std::string &body)
{
    const auto document = parseJson(body);
    if (!document || !document->is_object() || schema.sources.empty()) {
        return std::nullopt;
    }
    return std::vector<PayloadRow>{rowFromJson(*document, schema.sources.front().columns)};
}

std::optional<std::vector<PayloadRow>> parseJsonRows(const KindSchema &schema,
                                                     const std::string &body)
{
    const auto document = parseJson(body);
    if (!document || schema.sources.empty()) {
        return std::nullopt;
    }
    const RowSource &source = schema.sources.front();
    const json *rows = resolvePointer(*document, source.pointer);
    if (!rows || !rows->is_array()) {
        return std::nullopt;
    }

    std::vector<PayloadRow> result;
    for (const auto &element : *rows) {
        if (element.is_object()) {
            result.push_back(rowFromJson(element, source.columns));
        }
    }
    return result;
}

bool isGroup(const json &value)
{
    if (!value.is_object() || value.empty()) {
        return false;
    }
    return std::all_of(value.begin(), value.end(),
                       [](const json &member) { return member.is_object(); });
}

// Members become rows named by their key; placement groups are descended into.
void appendMapMembers(const json &members, const std::vector<ColumnSource> &columns,
                      std::vector<PayloadRow> &rows)
{
    for (const auto &item : members.items()) {
        if (!item.value().is_object()) {
            continue;
        }
        if (isGroup(item.value())) {
            appendMapMembers(item.value(), columns, rows);
            continue;
        }
        PayloadRow row = rowFromJson(item.value(), columns);
        row["server"] = item.key();
        rows.push_back(std::move(row));
    }
}

std::optional<std::vector<PayloadRow>> parseJsonMap(const KindSchema &schema,
                                                    const std::string &body)
{
    const auto document = parseJson(body);
    if (!document || schema.sources.empty()) {
        return std::nullopt;
    }
    const RowSource &source = schema.sources.front();
    const json *members = resolvePointer(*document, source.pointer);
    if (!members || !members->is_object()) {
        return std::nullopt;
    }

    std::vector<PayloadRow> result;
    appendMapMembers(*members, source.columns, result);
    return result;
}

std::optional<std::vector<PayloadRow>> parseJsonSections(const KindSchema &schema,
                                                         const std::string &body)
{
    const auto document = parseJson(body);
    if (!document || !document->is_object()) {
        return std::nullopt;
    }

    bool anySection = false;
    std::vector<PayloadRow> result;
    for (const auto &source : schema.sources) {
        const json *rows = resolvePointer(*document, source.pointer);
        if (!rows || !rows->is_array()) {
            continue;
        }
        anySection = true;
        for (const auto &element : *rows) {
            if (!element.is_object()) {
                continue;
            }
            PayloadRow row = rowFromJson(element, source.columns);
            row["section"] = source.section;
            result.push_back(std::move(row));
        }
    }
    if (!anySection) {
        return std::nullopt;
    }
    return result;
}

std::string escapePointerToken(const std::string &token)
{
    std::string escaped;
    for (const char c : token) {
        if (c == '~') {
            escaped += "~0";
        } else if (c == '/') {
            escaped += "~1";
        } else {
            escaped += c;
        }
    }
    return escaped;
}

void flattenInto(const json &value, const std::string &path, std::vector<PayloadRow> &rows)
{
    if (value.is_object() && !value.empty()) {
        for (const auto &item : value.items()) {
            flattenInto(item.value(), path + "/" + escapePointerToken(item.key()), rows);
        }
        return;
    }
    if (value.is_array() && !value.empty()) {
        for (size_t i = 0; i < value.size(); ++i) {
            flattenInto(value.at(i), path + "/" + std::to_string(i), rows);
        }
        return;
    }
    // Leaves, including empty containers so their presence is kept.
    rows.push_back(PayloadRow{{"path", path}, {"value", jsonToText(value)}});
}

std::optional<std::vector<PayloadRow>> parseJsonFlatten(const std::string &body)
{
    const auto document = parseJson(body);
    if (!document || !(document->is_object() || document->is_array())) {
        return std::nullopt;
    }
    std::vector<PayloadRow> result;
    flattenInto(*document, "", result);
    return result;
}

std::optional<std::vector<PayloadRow>> parseYbMetrics(const std::string &body)
{
    const auto document = parseJson(body);
    if (!document || !document->is_array()) {
        return std::nullopt;
    }

    std::vector<PayloadRow> result;
    for (const auto &entity : *document) {
        if (!entity.is_object()) {
            continue;
        }
        const std::string type = jsonToText(entity.value("type", json()));
        const std::string id = jsonToText(entity.value("id", json()));
        std::string namespaceName;
        std::string tableName;
        if (entity.contains("attributes") && entity.at("attributes").is_object()) {
            const auto &attributes = entity.at("attributes");
            namespaceName = jsonToText(attributes.value("namespace_name", json()));
            tableName = jsonToText(attributes.value("table_name", json()));
        }
        if (!entity.contains("metrics") || !entity.at("metrics").is_array()) {
            continue;
        }

        for (const auto &metric : entity.at("metrics")) {
            if (!metric.is_object() || !metric.contains("name")) {
                continue;
            }
            const std::string name = jsonToText(metric.at("name"));
            if (metric.contains("value")) {
                const auto &value = metric.at("value");
                if (!value.is_number()) {
                    continue;
                }
                const bool gauge = jsonToText(metric.value("type", json())) == "gauge";
                result.push_back(metricRow(type, id, namespaceName, tableName, name,
                                           jsonToText(value), gauge));
                continue;
            }
            // Histograms keep their running count and sum as two counters.
            if (metric.contains("total_count") && metric.contains("total_sum")
                && metric.at("total_count").is_number()
                && metric.at("total_sum").is_number()) {
                result.push_back(metricRow(type, id, namespaceName, tableName,
                                           name + ".count",
                                           jsonToText(metric.at("total_count")), false));
                result.push_back(metricRow(type, id, namespaceName, tableName,
                                           name + ".sum",
                                           jsonToText(metric.at("total_sum")), false));
            }
        }
    }
    return result;
}

std::optional<std::vector<PayloadRow>> parseYsqlStatements(const std::string &body)
{
    const auto document = parseJson(body);
    if (!document || !document->is_object() || !document->contains("statements")
        || !document->at("statements").is_array()) {
        return std::nullopt;
    }

    static const std::vector<std::string> kCounters = {"calls", "total_time", "rows"};

    std::vector<PayloadRow> result;
    for (const auto &statement : document->at("statements")) {
        if (!statement.is_object()) {
            continue;
        }
        const std::string query = jsonToText(statement.value("query", json()));
        std::string id = jsonToText(statement.value("query_id", json()));
        if (id.empty()) {
            id = query;
        }
        const std::string database = jsonToText(statement.value("dbname", json()));
        for (const auto &counter : kCounters) {
            if (!statement.contains(counter) || !statement.at(counter).is_number()) {
                continue;
            }
            result.push_back(metricRow("statement", id, database, query, counter,
                                       jsonToText(statement.at(counter)), false));
        }
    }
    return result;
}

struct PrometheusSample {
    std::string name;
    std::string labels;
    std::string value;
};

std::optional<PrometheusSample> parsePrometheusSample(const std::string &line)
{
    size_t pos = 0;
    while (pos < line.size() && line[pos] != '{'
           && !std::isspace(static_cast<unsigned char>(line[pos]))) {
        ++pos;
    }
    PrometheusSample sample;
    sample.name = line.substr(0, pos);
    if (sample.name.empty()) {
        return std::nullopt;
    }
    for (const char c : sample.name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != ':') {
            return std::nullopt;
        }
    }

    if (pos < line.size() && line[pos] == '{') {
        const size_t labelStart = pos + 1;
        bool inQuotes = false;
        for (++pos; pos < line.size(); ++pos) {
            const char c = line[pos];
            if (inQuotes && c == '\\') {
                ++pos;
                continue;
            }
            if (c == '"') {
                inQuotes = !inQuotes;
            } else if (c == '}' && !inQuotes) {
                break;
            }
        }
        if (pos >= line.size()) {
            return std::nullopt;
        }
        sample.labels = line.substr(labelStart, pos - labelStart);
        ++pos;
    }

    std::istringstream rest(line.substr(pos));
    if (!(rest >> sample.value)) {
        return std::nullopt;
    }
    return sample;
}

bool endsWith(const std::string &value, const std::string &suffix)
{
    return value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isPrometheusGauge(const std::string &name,
                       const std::unordered_map<std::string, std::string> &types)
{
    const auto exact = types.find(name);
    if (exact != types.end()) {
        return exact->second != "counter" && exact->second != "histogram";
    }
    for (const std::string suffix : {"_sum", "_count", "_bucket"}) {
        if (!endsWith(name, suffix)) {
            continue;
        }
        const auto base = types.find(name.substr(0, name.size() - suffix.size()));
        if (base != types.end()
            && (base->second == "histogram" || base->second == "summary")) {
            return false;
        }
    }
    return true;
}

std::optional<std::vector<PayloadRow>> parsePrometheusText(const std::string &body)
{
    std::unordered_map<std::string, std::string> types;
    std::vector<PrometheusSample> samples;
    int badLines = 0;

    for (const auto &raw : splitLines(body)) {
        const std::string line = trim(raw);
        if (line.empty()) {
            continue;
        }
        if (line[0] == '#') {
            std::istringstream comment(line.substr(1));
            std::string keyword;
            std::string name;
            std::string type;
            if (comment >> keyword >> name >> type && keyword == "TYPE") {
                types[name] = type;
            }
            continue;
        }
        auto sample = parsePrometheusSample(line);
        if (!sample) {
            ++badLines;
            continue;
        }
        samples.push_back(std::move(*sample));
    }

    if (samples.empty() && badLines > 0) {
        return std::nullopt;
    }

    std::vector<PayloadRow> result;
    for (const auto &sample : samples) {
        double value = 0.0;
        try {
            value = std::stod(sample.value);
        } catch (const std::exception &) {
            continue;
        }
        if (!std::isfinite(value)) {
            continue;
        }
        result.push_back(metricRow("node", sample.labels, "", "", sample.name,
                                   sample.value, isPrometheusGauge(sample.name, types)));
    }
    return result;
}

void decodeEntity(const std::string &html, size_t &pos, std::string &out)
{
    static const std::vector<std::pair<std::string, std::string>> kEntities = {
        {"&amp;", "&"}, {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""},
        {"&#39;", "'"}, {"&apos;", "'"}, {"&nbsp;", " "},
    };
    for (const auto &[entity, text] : kEntities) {
        if (html.compare(pos, entity.size(), entity) == 0) {
            out += text;
            pos += entity.size();
            return;
        }
    }
    out += '&';
    ++pos;
}

struct HtmlTable {
    std::vector<std::vector<std::string>> rows;
};

// Collect the contents of every <tag ...>...</tag> element between begin and
// end. The lowered copy is used for case-insensitive tag matching.
std::vector<std::string> elementContents(const std::string &html, const std::string &lowered,
                                         const std::string &tag, size_t begin, size_t end)
{
    std::vector<std::string> contents;
    const std::string open = "<" + tag;
    const std::string close = "</" + tag + ">";
    size_t pos = begin;
    while (pos < end) {
        size_t start = lowered.find(open, pos);
        if (start == std::string::npos || start >= end) {
            break;
        }
        const char next = start + open.size() < lowered.size() ? lowered[start + open.size()] : '\0';
        if (next != '>' && !std::isspace(static_cast<unsigned char>(next))) {
            pos = start + open.size();
            continue;
        }
        const size_t contentStart = lowered.find('>', start);
        if (contentStart == std::string::npos || contentStart >= end) {
            break;
        }
        size_t contentEnd = lowered.find(close, contentStart);
        if (contentEnd == std::string::npos || contentEnd > end) {
            contentEnd = end;
        }
        contents.push_back(html.substr(contentStart + 1, contentEnd - contentStart - 1));
        pos = contentEnd + close.size();
    }
    return contents;
}

std::vector<HtmlTable> extractTables(const std::string &html)
{
    const std::string lowered = toLower(html);
    std::vector<HtmlTable> tables;
    for (const auto &tableHtml : elementContents(html, lowered, "table", 0, html.size())) {
        const std::string tableLowered = toLower(tableHtml);
        HtmlTable table;
        for (const auto &rowHtml :
             elementContents(tableHtml, tableLowered, "tr", 0, tableHtml.size())) {
            const std::string rowLowered = toLower(rowHtml);
            std::vector<std::string> cells;
            for (const auto &cell :
                 elementContents(rowHtml, rowLowered, "td", 0, rowHtml.size())) {
                cells.push_back(htmlToText(cell));
            }
            if (!cells.empty()) {
                table.rows.push_back(std::move(cells));
            }
        }
        tables.push_back(std::move(table));
    }
    return tables;
}

std::optional<std::vector<PayloadRow>> parseHtmlTable(const KindSchema &schema,
                                                      const std::string &body)
{
    const auto tables = extractTables(body);
    if (tables.empty()) {
        return std::nullopt;
    }

    const size_t width = schema.columns.size();
    for (const auto &table : tables) {
        const bool matches = std::any_of(table.rows.begin(), table.rows.end(),
                                         [width](const auto &cells) {
                                             return cells.size() >= width;
                                         });
        if (!matches) {
            continue;
        }
        std::vector<PayloadRow> result;
        for (const auto &cells : table.rows) {
            if (cells.size() < width) {
                continue;
            }
            PayloadRow row;
            for (size_t i = 0; i < width; ++i) {
                row[schema.columns[i]] = cells[i];
            }
            result.push_back(std::move(row));
        }
        return result;
    }
    return std::vector<PayloadRow>{};
}

std::optional<std::vector<PayloadRow>> parseGflagLines(const std::string &body)
{
    std::vector<PayloadRow> result;
    for (const auto &raw : splitLines(body)) {
        std::string line = trim(raw);
        if (line.find('<') != std::string::npos) {
            // The raw page may still be wrapped in <pre>.
            line = htmlToText(line);
        }
        if (line.rfind("--", 0) != 0) {
            continue;
        }
        const size_t equals = line.find('=');
        if (equals == std::string::npos) {
            result.push_back(PayloadRow{{"name", line.substr(2)}, {"value", ""}});
            continue;
        }
        result.push_back(PayloadRow{{"name", line.substr(2, equals - 2)},
                                    {"value", line.substr(equals + 1)}});
    }
    if (result.empty() && !trim(body).empty()) {
        return std::nullopt;
    }
    return result;
}

// glog prefix: Lmmdd hh:mm:ss.uuuuuu threadid file:line] msg
std::optional<PayloadRow> parseGlogLine(const std::string &line)
{
    if (line.size() < 22 || std::string("IWEF").find(line[0]) == std::string::npos) {
        return std::nullopt;
    }
    std::istringstream stream(line.substr(1));
    std::string date;
    std::string time;
    std::string tid;
    if (!(stream >> date >> time >> tid)) {
        return std::nullopt;
    }
    const auto isDigit = [](unsigned char c) { return std::isdigit(c) != 0; };
    if (date.size() != 4 || !std::all_of(date.begin(), date.end(), isDigit)
        || time.size() < 8 || time[2] != ':'
        || !std::all_of(tid.begin(), tid.end(), isDigit)) {
        return std::nullopt;
    }
    const std::streamoff consumed = stream.tellg();
    if (consumed < 0) {
        return std::nullopt;
    }
    const size_t sourceStart = 1 + static_cast<size_t>(consumed);
    const size_t bracket = line.find(']', sourceStart);
    if (bracket == std::string::npos) {
        return std::nullopt;
    }
    std::string message = line.substr(bracket + 1);
    if (!message.empty() && message.front() == ' ') {
        message.erase(0, 1);
    }
    return PayloadRow{
        {"severity", std::string(1, line[0])},
        {"timestamp", date + " " + time},
        {"tid", tid},
        {"source", trim(line.substr(sourceStart, bracket - sourceStart))},
        {"message", message},
    };
}

std::optional<std::vector<PayloadRow>> parseGlogLines(const std::string &body)
{
    std::vector<PayloadRow> result;
    for (const auto &line : splitLines(body)) {
        if (auto row = parseGlogLine(line)) {
            result.push_back(std::move(*row));
            continue;
        }
        // Continuation of a multi-line message.
        if (!result.empty() && !line.empty()) {
            result.back()["message"] += "\n" + line;
        }
    }
    if (result.empty() && !trim(body).empty()) {
        return std::nullopt;
    }
    return result;
}

} // namespace

std::string htmlToText(const std::string &html)
{
    std::string text;
    bool inTag = false;
    for (size_t pos = 0; pos < html.size();) {
        const char c = html[pos];
        if (inTag) {
            if (c == '>') {
                inTag = false;
                text += ' ';
            }
            ++pos;
            continue;
        }
        if (c == '<') {
            inTag = true;
            ++pos;
            continue;
        }
        if (c == '&') {
            decodeEntity(html, pos, text);
            continue;
        }
        text += c;
        ++pos;
    }

    std::string collapsed;
    bool lastSpace = true;
    for (const char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!lastSpace) {
                collapsed += ' ';
            }
            lastSpace = true;
            continue;
        }
        collapsed += c;
        lastSpace = false;
    }
    return trim(collapsed);
}

std::optional<std::vector<PayloadRow>> parsePayload(const KindSchema &schema,
                                                    const std::string &body)
{
    // A malformed payload from one host must not end the pass.
    try {
        switch (schema.format) {
        case PayloadFormat::JsonObject:
            return parseJsonObject(schema, body);
        case PayloadFormat::JsonRows:
            return parseJsonRows(schema, body);
        case PayloadFormat::JsonMap:
            return parseJsonMap(schema, body);
        case PayloadFormat::JsonSections:
            return parseJsonSections(schema, body);
        case PayloadFormat::JsonFlatten:
            return parseJsonFlatten(body);
        case PayloadFormat::YbMetrics:
            return parseYbMetrics(body);
        case PayloadFormat::YsqlStatements:
            return parseYsqlStatements(body);
        case PayloadFormat::PrometheusText:
            return parsePrometheusText(body);
        case PayloadFormat::HtmlTable:
            return parseHtmlTable(schema, body);
        case PayloadFormat::GflagLines:
            return parseGflagLines(body);
        case PayloadFormat::GlogLines:
            return parseGlogLines(body);
        }
    } catch (const nlohmann::json::exception &) {
        return std::nullopt;
    }
    return std::nullopt;
}

} // namespace clusterstat

#include "common/csv.hpp"

namespace clusterstat {

namespace {

bool needsQuoting(const std::string &value)
{
    return value.find_first_of(",\"\r\n") != std::string::npos;
}

} // namespace

std::string formatCsvRow(const CsvRow &row)
{
    std::string line;
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            line += ',';
        }
        const std::string &value = row[i];
        if (!needsQuoting(value)) {
            line += value;
            continue;
        }
        line += '"';
        for (const char c : value) {
            if (c == '"') {
                line += '"';
            }
            line += c;
        }
        line += '"';
    }
    line += '\n';
    return line;
}

std::optional<std::vector<CsvRow>> parseCsv(const std::string &content)
{
    std::vector<CsvRow> rows;
    CsvRow row;
    std::string field;
    bool inQuotes = false;
    bool fieldWasQuoted = false;
    bool rowStarted = false;

    const auto endField = [&]() {
        row.push_back(field);
        field.clear();
        fieldWasQuoted = false;
    };
    const auto endRow = [&]() {
        endField();
        rows.push_back(std::move(row));
        row.clear();
        rowStarted = false;
    };

    for (size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];
        if (inQuotes) {
            if (c != '"') {
                field += c;
                continue;
            }
            if (i + 1 < content.size() && content[i + 1] == '"') {
                field += '"';
                ++i;
                continue;
            }
            inQuotes = false;
            continue;
        }

        switch (c) {
        case '"':
            // A quote may only open a field.
            if (!field.empty() || fieldWasQuoted) {
                return std::nullopt;
            }
            inQuotes = true;
            fieldWasQuoted = true;
            rowStarted = true;
            break;
        case ',':
            endField();
            rowStarted = true;
            break;
        case '\r':
            if (i + 1 < content.size() && content[i + 1] == '\n') {
                break;
            }
            return std::nullopt;
        case '\n':
            if (!rowStarted && row.empty()) {
                break;
            }
            endRow();
            break;
        default:
            if (fieldWasQuoted) {
                return std::nullopt;
            }
            field += c;
            rowStarted = true;
            break;
        }
    }

    if (inQuotes) {
        return std::nullopt;
    }
    if (rowStarted || !field.empty()) {
        endRow();
    }
    return rows;
}

} // namespace clusterstat

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace clusterstat {

using CsvRow = std::vector<std::string>;

// RFC 4180 style: fields with a comma, quote or line break are quoted and
// embedded quotes are doubled. The row ends with '\n'.
std::string formatCsvRow(const CsvRow &row);

// Returns std::nullopt for malformed input (unterminated quote, stray quote).
// Empty lines are not rows.
std::optional<std::vector<CsvRow>> parseCsv(const std::string &content);

} // namespace clusterstat

#pragma once

#include <optional>
#include <ostream>
#include <regex>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace clusterstat {

// Display-only narrowing; never influences what is fetched or stored.
struct ReportFilter {
    // Metric name for metric kinds, any key column for structured kinds.
    std::optional<std::regex> statName;
    // attribute_table_name of metric rows.
    std::optional<std::regex> tableName;
    std::optional<std::regex> hostname;
};

enum class OutputFormat {
    Table,
    Json
};

struct RenderOptions {
    ReportFilter filter;
    OutputFormat format = OutputFormat::Table;
    // Metric tables show entity id, namespace and table columns.
    bool details = false;
    // Cells wider than this are cut.
    size_t maxTextWidth = 80;
};

std::optional<OutputFormat> parseOutputFormat(const std::string &value);

KindDiff filterDiff(const KindDiff &diff, const ReportFilter &filter);

// Fixed-width table, columns separated by two spaces, widths taken from the
// content and capped at maxWidth.
std::string formatTable(const std::vector<std::string> &header,
                        const std::vector<std::vector<std::string>> &rows,
                        size_t maxWidth);

// Δsum / Δcount of the histogram a "<name>.sum" row belongs to, when the
// matching "<name>.count" row is in the same diff and moved.
std::optional<double> histogramAverage(const KindDiff &diff, const MetricDiffRow &sumRow);

void renderDiffs(std::ostream &out, const std::vector<KindDiff> &diffs,
                 const RenderOptions &options);

void renderRecords(std::ostream &out, const RecordSet &records, const RenderOptions &options);

void renderCatalog(std::ostream &out, const std::vector<CatalogEntry> &entries,
                   OutputFormat format);

} // namespace clusterstat

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace clusterstat {

// A column extracted from a JSON row. The pointer is relative to the row.
struct ColumnSource {
    std::string name;
    std::string pointer;
};

// A group of rows inside a JSON payload. For JsonSections every source also
// fills the "section" column with its name.
struct RowSource {
    std::string section;
    std::string pointer;
    std::vector<ColumnSource> columns;
};

/**
 * KindSchema describes everything kind-specific about an endpoint:
 * where it lives, which ports serve it, how its payload is parsed and
 * how its rows are identified. The collector, store, diff engine and
 * renderer are written once against this description.
 */
struct KindSchema {
    EndpointKind kind;
    std::string name;
    std::string path;
    // Ports the kind is served on; empty means every configured port.
    std::vector<int> ports;
    PayloadFormat format;
    RecordShape shape;
    // Persisted column order, excluding the envelope columns.
    std::vector<std::string> columns;
    std::vector<std::string> keyColumns;
    std::vector<RowSource> sources;
    std::string description;
};

// Envelope columns written in front of every kind file.
extern const std::vector<std::string> kEnvelopeColumns;
// Shared columns of every metric-shape kind.
extern const std::vector<std::string> kMetricColumns;

const std::vector<KindSchema> &allKindSchemas();
const KindSchema &schemaFor(EndpointKind kind);

std::string toKindString(EndpointKind kind);
std::optional<EndpointKind> parseKindString(const std::string &value);

std::vector<EndpointKind> allKinds();

} // namespace clusterstat

#pragma once

#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "collector/host_fetch.hpp"
#include "collector/payload_parsers.hpp"
#include "common/kind_registry.hpp"
#include "common/models.hpp"

namespace clusterstat {

struct CollectorOptions {
    // Upper bound on fetches in flight at any instant.
    int parallel = 1;
    FetchOptions fetch;
    // Suppresses console warnings; the event log still records them.
    bool silent = false;
    std::string uuid;
};

/**
 * Collector runs one pass per kind over a work list. Every host contributes
 * at least one record: unreachable hosts and unparsable payloads yield a
 * synthetic record instead of failing the pass. All records of a pass share
 * the timestamp taken when the pass started.
 *
 * Fetches run on the calling thread's event loop; collect() blocks until
 * every fetch of the pass has finished.
 */
class Collector
{
public:
    explicit Collector(CollectorOptions options);

    RecordSet collect(EndpointKind kind, const std::vector<Endpoint> &workList);

    // Kinds are collected one after the other. onKind is invoked as soon as a
    // kind's pass completes.
    std::vector<RecordSet> collectAll(const std::vector<EndpointKind> &kinds,
                                      const std::string &hosts,
                                      const std::string &ports,
                                      const std::optional<std::regex> &hostnameFilter,
                                      const std::function<void(const RecordSet &)> &onKind = {});

    const CollectorOptions &options() const { return m_options; }

private:
    CollectorOptions m_options;
};

// Rows of one host turned into stored records, later duplicates of a key
// dropped. Columns missing from a row are stored empty.
std::vector<StoredRecord> toStoredRecords(const KindSchema &schema,
                                          const std::string &hostnamePort,
                                          std::chrono::system_clock::time_point timestamp,
                                          const std::vector<PayloadRow> &rows);

StoredRecord syntheticRecord(const std::string &hostnamePort,
                             std::chrono::system_clock::time_point timestamp);

} // namespace clusterstat

#pragma once

#include <vector>

#include "common/kind_registry.hpp"
#include "common/models.hpp"

namespace clusterstat {

class SnapshotStore;

struct DiffOptions {
    // Gauge rows are left out unless enabled.
    bool includeGauges = false;
    // Rows whose delta is zero are left out unless enabled.
    bool includeUnchanged = false;
    // Off: table, tablet and cdc metrics are summed per host, type and name.
    bool details = false;
};

/**
 * Compare two record sets of the same kind. Metric kinds produce
 * delta/rate rows, structured kinds produce added/removed/changed rows.
 * Hosts with a synthetic record on either side take no part and are
 * reported in unavailableHosts.
 */
KindDiff diffRecordSets(const RecordSet &begin, const RecordSet &end,
                        const DiffOptions &options);

// Throws StoreError InvalidRequest when begin >= end and NotFound when
// either number is missing from the catalog. Reads no kind file.
void validateDiffRequest(const SnapshotStore &store, int begin, int end);

// Validated stored diff over the requested kinds. Kinds that were not
// captured in both snapshots are skipped.
std::vector<KindDiff> diffSnapshots(const SnapshotStore &store, int begin, int end,
                                    const std::vector<EndpointKind> &kinds,
                                    const DiffOptions &options);

} // namespace clusterstat

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace clusterstat {

class StoreError : public std::runtime_error
{
public:
    enum class Code {
        NotFound,
        Corrupt,
        InvalidRequest,
        WriteFailed
    };

    StoreError(Code code, const std::string &message)
        : std::runtime_error(message)
        , m_code(code)
    {
    }

    Code code() const { return m_code; }

private:
    Code m_code;
};

/**
 * SnapshotStore keeps numbered snapshots below one root directory:
 *
 *   <root>/snapshot.index      catalog, CSV number,timestamp,comment
 *   <root>/<number>/<kind>.csv one file per captured kind
 *
 * A single writer per root is assumed. Numbers are never reused, even when
 * a snapshot directory has been removed by hand.
 */
class SnapshotStore {
public:
    explicit SnapshotStore(std::string rootPath);
    ~SnapshotStore();

    // Allocate the next number, create its directory and append it to the
    // catalog. The catalog is synced to disk before returning.
    CatalogEntry beginSnapshot(const std::string &comment);

    // Replace the kind file of a snapshot in one step; readers never see a
    // partially written file.
    void writeKind(int number, const RecordSet &records);

    std::vector<CatalogEntry> listSnapshots() const;
    CatalogEntry snapshotInfo(int number) const;
    std::vector<EndpointKind> availableKinds(int number) const;

    // Throws StoreError NotFound or Corrupt; never returns a partial set.
    RecordSet load(int number, EndpointKind kind) const;

    const std::string &rootPath() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace clusterstat

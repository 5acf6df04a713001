#include "store/snapshot_store.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

#include <QFile>
#include <QSaveFile>
#include <QString>

#include <nlohmann/json.hpp>

#include <unistd.h>

#include "common/csv.hpp"
#include "common/json_utils.hpp"
#include "common/kind_registry.hpp"
#include "common/logging.hpp"

namespace clusterstat {

namespace {

constexpr const char *kCatalogFileName = "snapshot.index";
const CsvRow kCatalogHeader = {"number", "timestamp", "comment"};

std::optional<int> parseNumber(const std::string &value)
{
    if (value.empty() || value.size() > 9
        || !std::all_of(value.begin(), value.end(),
                        [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return std::stoi(value);
}

std::string readWholeFile(const std::filesystem::path &path)
{
    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::ReadOnly)) {
        throw StoreError(StoreError::Code::NotFound,
                         "cannot open " + path.string() + ": "
                             + file.errorString().toStdString());
    }
    return file.readAll().toStdString();
}

std::string kindFileName(EndpointKind kind)
{
    return toKindString(kind) + ".csv";
}

CsvRow fileHeader(const KindSchema &schema)
{
    CsvRow header = kEnvelopeColumns;
    header.insert(header.end(), schema.columns.begin(), schema.columns.end());
    return header;
}

} // namespace

struct SnapshotStore::Impl {
    std::string root;

    std::filesystem::path rootPath() const { return std::filesystem::path(root); }
    std::filesystem::path catalogPath() const { return rootPath() / kCatalogFileName; }
    std::filesystem::path snapshotPath(int number) const
    {
        return rootPath() / std::to_string(number);
    }

    std::vector<CatalogEntry> readCatalog() const;
    int highestDirectoryNumber() const;
    void appendCatalog(const CatalogEntry &entry) const;
};

std::vector<CatalogEntry> SnapshotStore::Impl::readCatalog() const
{
    const auto path = catalogPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return {};
    }

    const auto rows = parseCsv(readWholeFile(path));
    if (!rows.has_value()) {
        throw StoreError(StoreError::Code::Corrupt,
                         "catalog " + path.string() + " is not valid CSV");
    }

    std::vector<CatalogEntry> entries;
    for (size_t i = 0; i < rows->size(); ++i) {
        const CsvRow &row = rows->at(i);
        if (i == 0 && row == kCatalogHeader) {
            continue;
        }
        if (row.size() != kCatalogHeader.size()) {
            throw StoreError(StoreError::Code::Corrupt,
                             "catalog " + path.string() + " has a malformed entry at row "
                                 + std::to_string(i + 1));
        }
        const auto number = parseNumber(row[0]);
        const auto timestamp = parseTimestamp(row[1]);
        if (!number.has_value() || !timestamp.has_value()) {
            throw StoreError(StoreError::Code::Corrupt,
                             "catalog " + path.string() + " has an invalid entry at row "
                                 + std::to_string(i + 1));
        }
        entries.push_back(CatalogEntry{*number, *timestamp, row[2]});
    }

    std::sort(entries.begin(), entries.end(),
              [](const CatalogEntry &a, const CatalogEntry &b) {
                  return a.number < b.number;
              });
    return entries;
}

int SnapshotStore::Impl::highestDirectoryNumber() const
{
    int highest = 0;
    std::error_code ec;
    // Entries that cannot be inspected are skipped.
    std::filesystem::directory_iterator it(rootPath(), ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        std::error_code entryEc;
        if (!it->is_directory(entryEc)) {
            continue;
        }
        if (const auto number = parseNumber(it->path().filename().string())) {
            highest = std::max(highest, *number);
        }
    }
    return highest;
}

void SnapshotStore::Impl::appendCatalog(const CatalogEntry &entry) const
{
    const auto path = catalogPath();
    std::error_code ec;
    const bool fresh = !std::filesystem::exists(path, ec);

    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        throw StoreError(StoreError::Code::WriteFailed,
                         "cannot open catalog " + path.string() + ": "
                             + file.errorString().toStdString());
    }

    std::string text;
    if (fresh) {
        text += formatCsvRow(kCatalogHeader);
    }
    text += formatCsvRow({std::to_string(entry.number),
                          formatTimestamp(entry.timestamp),
                          entry.comment});

    const QByteArray bytes = QByteArray::fromStdString(text);
    if (file.write(bytes) != bytes.size() || !file.flush()
        || ::fsync(file.handle()) != 0) {
        throw StoreError(StoreError::Code::WriteFailed,
                         "cannot append to catalog " + path.string());
    }
}

SnapshotStore::SnapshotStore(std::string rootPath)
    : impl(std::make_unique<Impl>())
{
    impl->root = std::move(rootPath);
}

SnapshotStore::~SnapshotStore() = default;

const std::string &SnapshotStore::rootPath() const
{
    return impl->root;
}

CatalogEntry SnapshotStore::beginSnapshot(const std::string &comment)
{
    std::error_code ec;
    std::filesystem::create_directories(impl->rootPath(), ec);
    if (ec) {
        throw StoreError(StoreError::Code::WriteFailed,
                         "cannot create snapshot root " + impl->root + ": " + ec.message());
    }

    int highest = impl->highestDirectoryNumber();
    for (const auto &entry : impl->readCatalog()) {
        highest = std::max(highest, entry.number);
    }

    CatalogEntry entry;
    entry.number = highest + 1;
    entry.timestamp = std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    entry.comment = comment;

    const auto directory = impl->snapshotPath(entry.number);
    if (!std::filesystem::create_directory(directory, ec) || ec) {
        throw StoreError(StoreError::Code::WriteFailed,
                         "cannot create snapshot directory " + directory.string()
                             + (ec ? ": " + ec.message() : std::string()));
    }
    impl->appendCatalog(entry);

    CLOG_INFO(QStringLiteral("SnapshotStore"),
              QStringLiteral("beginSnapshot"),
              QStringLiteral("snapshot_allocated"),
              QStringLiteral("snapshot_requested"),
              QStringLiteral("catalog_append"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"number", entry.number},
                              {"root", impl->root},
                              {"comment", comment}}));
    return entry;
}

void SnapshotStore::writeKind(int number, const RecordSet &records)
{
    const auto directory = impl->snapshotPath(number);
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        throw StoreError(StoreError::Code::NotFound,
                         "snapshot " + std::to_string(number) + " does not exist");
    }

    const KindSchema &schema = schemaFor(records.kind);
    const auto path = directory / kindFileName(records.kind);

    std::string text = formatCsvRow(fileHeader(schema));
    for (const auto &record : records.records) {
        CsvRow row = {record.hostnamePort,
                      formatTimestamp(record.timestamp),
                      record.synthetic ? "true" : "false"};
        for (const auto &column : schema.columns) {
            row.push_back(fieldValue(record, column));
        }
        text += formatCsvRow(row);
    }

    QSaveFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::WriteOnly)) {
        throw StoreError(StoreError::Code::WriteFailed,
                         "cannot write " + path.string() + ": "
                             + file.errorString().toStdString());
    }
    const QByteArray bytes = QByteArray::fromStdString(text);
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        throw StoreError(StoreError::Code::WriteFailed,
                         "cannot write " + path.string() + ": "
                             + file.errorString().toStdString());
    }

    CLOG_DEBUG(QStringLiteral("SnapshotStore"),
               QStringLiteral("writeKind"),
               QStringLiteral("kind_written"),
               QStringLiteral("snapshot_capture"),
               QStringLiteral("qsavefile"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"number", number},
                               {"kind", schema.name},
                               {"records", records.records.size()}}));
}

std::vector<CatalogEntry> SnapshotStore::listSnapshots() const
{
    return impl->readCatalog();
}

CatalogEntry SnapshotStore::snapshotInfo(int number) const
{
    for (const auto &entry : impl->readCatalog()) {
        if (entry.number == number) {
            return entry;
        }
    }
    throw StoreError(StoreError::Code::NotFound,
                     "snapshot " + std::to_string(number) + " is not in the catalog");
}

std::vector<EndpointKind> SnapshotStore::availableKinds(int number) const
{
    const auto directory = impl->snapshotPath(number);
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        throw StoreError(StoreError::Code::NotFound,
                         "snapshot " + std::to_string(number) + " does not exist");
    }

    std::vector<EndpointKind> kinds;
    for (const auto kind : allKinds()) {
        if (std::filesystem::is_regular_file(directory / kindFileName(kind), ec)) {
            kinds.push_back(kind);
        }
    }
    return kinds;
}

RecordSet SnapshotStore::load(int number, EndpointKind kind) const
{
    // Directories left behind by a failed catalog append are not snapshots.
    const CatalogEntry entry = snapshotInfo(number);
    const auto path = impl->snapshotPath(number) / kindFileName(kind);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw StoreError(StoreError::Code::NotFound,
                         "snapshot " + std::to_string(number) + " has no "
                             + toKindString(kind) + " data");
    }

    const auto corrupt = [&path](const std::string &detail) {
        return StoreError(StoreError::Code::Corrupt, path.string() + ": " + detail);
    };

    const auto rows = parseCsv(readWholeFile(path));
    if (!rows.has_value()) {
        throw corrupt("not valid CSV");
    }
    const KindSchema &schema = schemaFor(kind);
    const CsvRow header = fileHeader(schema);
    if (rows->empty() || rows->front() != header) {
        throw corrupt("header does not match the " + schema.name + " columns");
    }

    RecordSet result;
    result.kind = kind;
    for (size_t i = 1; i < rows->size(); ++i) {
        const CsvRow &row = rows->at(i);
        if (row.size() != header.size()) {
            throw corrupt("row " + std::to_string(i + 1) + " has " + std::to_string(row.size())
                          + " fields, expected " + std::to_string(header.size()));
        }
        const auto timestamp = parseTimestamp(row[1]);
        if (!timestamp.has_value()) {
            throw corrupt("row " + std::to_string(i + 1) + " has an invalid timestamp");
        }
        if (row[2] != "true" && row[2] != "false") {
            throw corrupt("row " + std::to_string(i + 1) + " has an invalid synthetic flag");
        }

        StoredRecord record;
        record.hostnamePort = row[0];
        record.timestamp = *timestamp;
        record.synthetic = row[2] == "true";
        for (size_t c = 0; c < schema.columns.size(); ++c) {
            record.fields[schema.columns[c]] = row[kEnvelopeColumns.size() + c];
        }
        result.records.push_back(std::move(record));
    }

    if (!result.records.empty()) {
        result.timestamp = result.records.front().timestamp;
    } else {
        // An empty kind file carries no pass timestamp; fall back to the catalog.
        result.timestamp = entry.timestamp;
    }
    return result;
}

} // namespace clusterstat

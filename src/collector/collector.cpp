#include "collector/collector.hpp"

#include <algorithm>
#include <deque>
#include <memory>
#include <set>

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QtGlobal>

#include <nlohmann/json.hpp>

#include "collector/endpoint_resolver.hpp"
#include "common/logging.hpp"

namespace clusterstat {

namespace {

std::chrono::system_clock::time_point passTimestamp()
{
    // Stored timestamps carry milliseconds; keep the in-memory value equal.
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

} // namespace

StoredRecord syntheticRecord(const std::string &hostnamePort,
                             std::chrono::system_clock::time_point timestamp)
{
    StoredRecord record;
    record.hostnamePort = hostnamePort;
    record.timestamp = timestamp;
    record.synthetic = true;
    return record;
}

std::vector<StoredRecord> toStoredRecords(const KindSchema &schema,
                                          const std::string &hostnamePort,
                                          std::chrono::system_clock::time_point timestamp,
                                          const std::vector<PayloadRow> &rows)
{
    std::vector<StoredRecord> records;
    std::set<std::vector<std::string>> seenKeys;

    for (const auto &row : rows) {
        StoredRecord record;
        record.hostnamePort = hostnamePort;
        record.timestamp = timestamp;
        for (const auto &column : schema.columns) {
            const auto it = row.find(column);
            record.fields[column] = it != row.end() ? it->second : std::string();
        }

        std::vector<std::string> key;
        key.reserve(schema.keyColumns.size());
        for (const auto &column : schema.keyColumns) {
            key.push_back(record.fields[column]);
        }
        if (!seenKeys.insert(key).second) {
            continue;
        }
        records.push_back(std::move(record));
    }
    return records;
}

Collector::Collector(CollectorOptions options)
    : m_options(std::move(options))
{
    if (m_options.parallel < 1) {
        m_options.parallel = 1;
    }
}

RecordSet Collector::collect(EndpointKind kind, const std::vector<Endpoint> &workList)
{
    const KindSchema &schema = schemaFor(kind);
    const std::string path = endpointPath(kind, m_options.uuid);

    RecordSet result;
    result.kind = kind;
    result.timestamp = passTimestamp();

    const QString corrId = logging::newCorrelationId(QStringLiteral("collect"));
    logging::CorrelationScope scope(corrId);

    CLOG_INFO(QStringLiteral("Collector"),
              QStringLiteral("collect"),
              QStringLiteral("collect_start"),
              QStringLiteral("collect_pass"),
              QStringLiteral("http_get"),
              logging::defaultWho(),
              corrId,
              (nlohmann::json{{"kind", schema.name},
                              {"hosts", workList.size()},
                              {"parallel", m_options.parallel}}));

    if (workList.empty()) {
        return result;
    }

    QNetworkAccessManager network;
    QEventLoop loop;
    // Parent of the pass's fetches; destroyed before the network manager.
    QObject fetches;
    std::deque<Endpoint> pending(workList.begin(), workList.end());
    size_t completed = 0;
    int unavailable = 0;

    const auto handleResult = [&](const FetchResult &fetched) {
        const std::string hostnamePort = fetched.endpoint.hostnamePort();
        std::optional<std::vector<PayloadRow>> rows;
        std::string failure = fetched.error;
        if (fetched.ok) {
            rows = parsePayload(schema, fetched.body);
            if (!rows.has_value()) {
                failure = "payload could not be parsed";
            }
        }

        if (!rows.has_value()) {
            ++unavailable;
            result.records.push_back(syntheticRecord(hostnamePort, result.timestamp));
            if (!m_options.silent) {
                qWarning("%s: %s: %s", schema.name.c_str(), hostnamePort.c_str(),
                         failure.c_str());
            }
            CLOG_WARN(QStringLiteral("Collector"),
                      QStringLiteral("collect"),
                      QStringLiteral("host_unavailable"),
                      QString::fromStdString(failure),
                      QStringLiteral("http_get"),
                      logging::defaultWho(),
                      corrId,
                      (nlohmann::json{{"kind", schema.name}, {"endpoint", hostnamePort}}));
            return;
        }

        auto records = toStoredRecords(schema, hostnamePort, result.timestamp, *rows);
        result.records.insert(result.records.end(),
                              std::make_move_iterator(records.begin()),
                              std::make_move_iterator(records.end()));
    };

    // At most `parallel` fetches are in flight; each completion admits the next.
    std::function<void()> admitNext = [&]() {
        if (pending.empty()) {
            return;
        }
        Endpoint endpoint = pending.front();
        pending.pop_front();

        auto *fetch = new HostFetch(network, std::move(endpoint), path, m_options.fetch,
                                    &fetches);
        QObject::connect(fetch, &HostFetch::finished, &loop,
                         [&](const FetchResult &fetched) {
                             handleResult(fetched);
                             ++completed;
                             if (completed == workList.size()) {
                                 loop.quit();
                                 return;
                             }
                             admitNext();
                         });
        fetch->start();
    };

    const size_t initial = std::min(workList.size(), static_cast<size_t>(m_options.parallel));
    for (size_t i = 0; i < initial; ++i) {
        admitNext();
    }
    if (completed < workList.size()) {
        loop.exec();
    }

    CLOG_INFO(QStringLiteral("Collector"),
              QStringLiteral("collect"),
              QStringLiteral("collect_complete"),
              QStringLiteral("collect_pass"),
              QStringLiteral("http_get"),
              logging::defaultWho(),
              corrId,
              (nlohmann::json{{"kind", schema.name},
                              {"records", result.records.size()},
                              {"unavailable", unavailable}}));
    return result;
}

std::vector<RecordSet> Collector::collectAll(const std::vector<EndpointKind> &kinds,
                                             const std::string &hosts,
                                             const std::string &ports,
                                             const std::optional<std::regex> &hostnameFilter,
                                             const std::function<void(const RecordSet &)> &onKind)
{
    std::vector<RecordSet> sets;
    sets.reserve(kinds.size());
    for (const auto kind : kinds) {
        const auto workList = resolveWorkList(kind, hosts, ports, hostnameFilter, m_options.uuid);
        RecordSet set = collect(kind, workList);
        if (onKind) {
            onKind(set);
        }
        sets.push_back(std::move(set));
    }
    return sets;
}

} // namespace clusterstat

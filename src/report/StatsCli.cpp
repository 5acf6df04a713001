#include "report/StatsCli.hpp"

#include <algorithm>
#include <filesystem>
#include <string>

#include <QtGlobal>

#include <nlohmann/json.hpp>

#include "collector/endpoint_resolver.hpp"
#include "common/clusterstat_version.hpp"
#include "common/json_utils.hpp"
#include "common/kind_registry.hpp"
#include "common/logging.hpp"
#include "store/snapshot_store.hpp"

namespace clusterstat {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  clusterstat snapshot [--comment TEXT] [options]\n"
        "  clusterstat list [options]\n"
        "  clusterstat diff --begin N --end N [options]\n"
        "  clusterstat adhoc-diff [options]\n"
        "  clusterstat print KIND [--snapshot N] [options]\n"
        "  clusterstat version\n"
        "\n"
        "Options:\n"
        "  --hosts LIST            comma separated hosts\n"
        "  --ports LIST            comma separated ports\n"
        "  --parallel N            fetches in flight at once\n"
        "  --kinds LIST            kinds to collect or diff (default: all)\n"
        "  --stat-name-match RE    show matching metric names or keys\n"
        "  --table-name-match RE   show matching table names\n"
        "  --hostname-match RE     show (and for live data fetch) matching hosts\n"
        "  --gauges-enable         include gauge metrics\n"
        "  --details-enable        one row per table, tablet and cdc entity\n"
        "  --include-unchanged     include rows that did not change\n"
        "  --silent                no warnings for unavailable hosts\n"
        "  --uuid UUID             table or tablet for the detail kinds\n"
        "  --sql-length N          maximum cell width (default 80)\n"
        "  --format table|json     output format\n"
        "  --snapshot-root DIR     snapshot directory\n"
        "  --timeout-ms MS         request timeout\n"
        "  --tls                   use https\n"
        "  --trace                 debug events in the event log\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

std::optional<std::string> optionalArg(const QStringList &args, const QString &key)
{
    if (!args.contains(key)) {
        return std::nullopt;
    }
    return getArgValue(args, key).toStdString();
}

bool hasFlag(const QStringList &args, const QString &flag)
{
    return args.contains(flag);
}

std::optional<int> parseInt(const QString &value)
{
    bool ok = false;
    const int parsed = value.toInt(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace

StatsCli::StatsCli(std::ostream &out, std::ostream &err, WaitFunction waitForOperator)
    : m_out(out)
    , m_err(err)
    , m_waitForOperator(std::move(waitForOperator))
{
}

int StatsCli::usageError()
{
    m_err << usageText().toStdString();
    return 1;
}

int StatsCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        return usageError();
    }

    const QString command = args.at(1);
    CLOG_INFO(QStringLiteral("StatsCli"),
              QStringLiteral("run"),
              QStringLiteral("stats_cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()}}));

    if (command == QStringLiteral("version")) {
        m_out << "clusterstat " << CLUSTERSTAT_VERSION << "\n";
        return 0;
    }

    const auto invocation = parseInvocation(args);
    if (!invocation.has_value()) {
        return 1;
    }

    try {
        if (command == QStringLiteral("snapshot")) {
            return runSnapshot(*invocation);
        }
        if (command == QStringLiteral("list")) {
            return runList(*invocation);
        }
        if (command == QStringLiteral("diff")) {
            return runDiff(*invocation);
        }
        if (command == QStringLiteral("adhoc-diff")) {
            return runAdhocDiff(*invocation);
        }
        if (command == QStringLiteral("print")) {
            return runPrint(*invocation);
        }
    } catch (const StoreError &error) {
        CLOG_ERROR(QStringLiteral("StatsCli"),
                   QStringLiteral("run"),
                   QStringLiteral("command_failed"),
                   QString::fromUtf8(error.what()),
                   QStringLiteral("snapshot_store"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"command", command.toStdString()},
                                   {"code", static_cast<int>(error.code())}}));
        m_err << "Fatal: " << error.what() << std::endl;
        return 1;
    } catch (const std::filesystem::filesystem_error &error) {
        CLOG_ERROR(QStringLiteral("StatsCli"),
                   QStringLiteral("run"),
                   QStringLiteral("command_failed"),
                   QString::fromLocal8Bit(error.what()),
                   QStringLiteral("filesystem"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"command", command.toStdString()},
                                   {"path", error.path1().string()}}));
        m_err << "Fatal: " << error.what() << std::endl;
        return 1;
    }

    return usageError();
}

std::optional<StatsCli::Invocation> StatsCli::parseInvocation(const QStringList &args)
{
    Invocation invocation;
    invocation.args = args;
    invocation.silent = hasFlag(args, QStringLiteral("--silent"));

    SettingsOverrides overrides;
    overrides.hosts = optionalArg(args, QStringLiteral("--hosts"));
    overrides.ports = optionalArg(args, QStringLiteral("--ports"));
    overrides.parallel = optionalArg(args, QStringLiteral("--parallel"));
    overrides.snapshotRoot = optionalArg(args, QStringLiteral("--snapshot-root"));
    overrides.timeoutMs = optionalArg(args, QStringLiteral("--timeout-ms"));
    overrides.uuid = optionalArg(args, QStringLiteral("--uuid"));
    overrides.useTls = hasFlag(args, QStringLiteral("--tls"));
    invocation.config = resolveSettings(overrides);

    for (const auto &warning : invocation.config.warnings) {
        if (!invocation.silent) {
            qWarning("%s", warning.c_str());
        }
        CLOG_WARN(QStringLiteral("StatsCli"),
                  QStringLiteral("parseInvocation"),
                  QStringLiteral("config_warning"),
                  QString::fromStdString(warning),
                  QStringLiteral("config"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json::object());
    }
    if (!invocation.config.changedOptions.empty()) {
        CLOG_INFO(QStringLiteral("StatsCli"),
                  QStringLiteral("parseInvocation"),
                  QStringLiteral("options_overridden"),
                  QStringLiteral("user_invocation"),
                  QStringLiteral("cli"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"options", invocation.config.changedOptions}}));
    }

    if (hasFlag(args, QStringLiteral("--kinds"))) {
        for (const auto &name : splitList(getArgValue(args, QStringLiteral("--kinds")).toStdString())) {
            const auto kind = parseKindString(name);
            if (!kind.has_value()) {
                m_err << "Unknown kind: " << name << std::endl;
                return std::nullopt;
            }
            if (std::find(invocation.kinds.begin(), invocation.kinds.end(), *kind)
                == invocation.kinds.end()) {
                invocation.kinds.push_back(*kind);
            }
        }
        if (invocation.kinds.empty()) {
            m_err << "No kinds given." << std::endl;
            return std::nullopt;
        }
    } else {
        invocation.kinds = allKinds();
    }

    try {
        const auto compile = [&args](const QString &key) -> std::optional<std::regex> {
            if (!args.contains(key)) {
                return std::nullopt;
            }
            return std::regex(getArgValue(args, key).toStdString());
        };
        invocation.render.filter.statName = compile(QStringLiteral("--stat-name-match"));
        invocation.render.filter.tableName = compile(QStringLiteral("--table-name-match"));
        invocation.render.filter.hostname = compile(QStringLiteral("--hostname-match"));
    } catch (const std::regex_error &error) {
        m_err << "Invalid regular expression: " << error.what() << std::endl;
        return std::nullopt;
    }
    invocation.hostnameFilter = invocation.render.filter.hostname;

    if (hasFlag(args, QStringLiteral("--sql-length"))) {
        const auto width = parseInt(getArgValue(args, QStringLiteral("--sql-length")));
        if (!width.has_value() || *width < 1) {
            m_err << "Invalid --sql-length value." << std::endl;
            return std::nullopt;
        }
        invocation.render.maxTextWidth = static_cast<size_t>(*width);
    }

    if (hasFlag(args, QStringLiteral("--format"))) {
        const auto format =
            parseOutputFormat(getArgValue(args, QStringLiteral("--format")).toLower().toStdString());
        if (!format.has_value()) {
            m_err << "Invalid format. Use table or json." << std::endl;
            return std::nullopt;
        }
        invocation.render.format = *format;
    }

    invocation.diff.includeGauges = hasFlag(args, QStringLiteral("--gauges-enable"));
    invocation.diff.includeUnchanged = hasFlag(args, QStringLiteral("--include-unchanged"));
    invocation.diff.details = hasFlag(args, QStringLiteral("--details-enable"));
    invocation.render.details = invocation.diff.details;
    return invocation;
}

CollectorOptions StatsCli::collectorOptions(const Invocation &invocation) const
{
    const Settings &settings = invocation.config.settings;
    CollectorOptions options;
    options.parallel = settings.parallel;
    options.fetch.probeTimeoutMs = settings.probeTimeoutMs;
    options.fetch.requestTimeoutMs = settings.requestTimeoutMs;
    options.fetch.useTls = settings.useTls;
    options.silent = invocation.silent;
    options.uuid = settings.uuid;
    return options;
}

int StatsCli::runSnapshot(const Invocation &invocation)
{
    // A snapshot captures every host; display filters do not apply here.
    const Settings &settings = invocation.config.settings;
    SnapshotStore store(settings.snapshotRoot);
    const CatalogEntry entry =
        store.beginSnapshot(getArgValue(invocation.args, QStringLiteral("--comment")).toStdString());

    Collector collector(collectorOptions(invocation));
    collector.collectAll(invocation.kinds, settings.hosts, settings.ports, std::nullopt,
                         [&store, &entry](const RecordSet &records) {
                             store.writeKind(entry.number, records);
                         });

    m_out << "Snapshot " << entry.number << " created at "
          << formatTimestamp(entry.timestamp) << std::endl;
    return 0;
}

int StatsCli::runList(const Invocation &invocation)
{
    SnapshotStore store(invocation.config.settings.snapshotRoot);
    renderCatalog(m_out, store.listSnapshots(), invocation.render.format);
    return 0;
}

int StatsCli::runDiff(const Invocation &invocation)
{
    const auto begin = parseInt(getArgValue(invocation.args, QStringLiteral("--begin")));
    const auto end = parseInt(getArgValue(invocation.args, QStringLiteral("--end")));
    if (!begin.has_value() || !end.has_value()) {
        return usageError();
    }

    SnapshotStore store(invocation.config.settings.snapshotRoot);
    const auto diffs = diffSnapshots(store, *begin, *end, invocation.kinds, invocation.diff);

    CLOG_INFO(QStringLiteral("StatsCli"),
              QStringLiteral("runDiff"),
              QStringLiteral("report_diff"),
              QStringLiteral("user_invocation"),
              QStringLiteral("snapshot_store"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"begin", *begin}, {"end", *end}, {"kinds", diffs.size()}}));
    renderDiffs(m_out, diffs, invocation.render);
    return 0;
}

int StatsCli::runAdhocDiff(const Invocation &invocation)
{
    const Settings &settings = invocation.config.settings;
    Collector collector(collectorOptions(invocation));

    const auto beginSets = collector.collectAll(invocation.kinds, settings.hosts,
                                                settings.ports, invocation.hostnameFilter);
    if (m_waitForOperator) {
        m_waitForOperator();
    } else {
        m_out << "Begin pass captured. Press Enter to capture the end pass." << std::endl;
        std::string line;
        std::getline(std::cin, line);
    }
    const auto endSets = collector.collectAll(invocation.kinds, settings.hosts,
                                              settings.ports, invocation.hostnameFilter);

    std::vector<KindDiff> diffs;
    for (size_t i = 0; i < beginSets.size() && i < endSets.size(); ++i) {
        diffs.push_back(diffRecordSets(beginSets[i], endSets[i], invocation.diff));
    }
    renderDiffs(m_out, diffs, invocation.render);
    return 0;
}

int StatsCli::runPrint(const Invocation &invocation)
{
    const QStringList &args = invocation.args;
    if (args.size() < 3 || args.at(2).startsWith(QStringLiteral("--"))) {
        return usageError();
    }
    const auto kind = parseKindString(args.at(2).toStdString());
    if (!kind.has_value()) {
        m_err << "Unknown kind: " << args.at(2).toStdString() << std::endl;
        return 1;
    }

    const Settings &settings = invocation.config.settings;
    if (hasFlag(args, QStringLiteral("--snapshot"))) {
        const auto number = parseInt(getArgValue(args, QStringLiteral("--snapshot")));
        if (!number.has_value()) {
            return usageError();
        }
        SnapshotStore store(settings.snapshotRoot);
        renderRecords(m_out, store.load(*number, *kind), invocation.render);
        return 0;
    }

    Collector collector(collectorOptions(invocation));
    const auto workList = resolveWorkList(*kind, settings.hosts, settings.ports,
                                          invocation.hostnameFilter, settings.uuid);
    renderRecords(m_out, collector.collect(*kind, workList), invocation.render);
    return 0;
}

} // namespace clusterstat

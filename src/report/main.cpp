#include <QCoreApplication>

#include "common/clusterstat_version.hpp"
#include "common/logging.hpp"
#include "report/StatsCli.hpp"

#include <vector>

#include <nlohmann/json.hpp>

namespace {

// --trace is consumed here; everything else goes to the command.
std::vector<QByteArray> commandArguments(int argc, char *argv[], bool &trace)
{
    std::vector<QByteArray> args;
    args.reserve(static_cast<size_t>(argc));
    for (int i = 0; i < argc; ++i) {
        const QByteArray arg(argv[i]);
        if (arg == "--trace") {
            trace = true;
        } else {
            args.push_back(arg);
        }
    }
    return args;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("clusterstat"));
    QCoreApplication::setApplicationVersion(QString::fromUtf8(CLUSTERSTAT_VERSION));

    bool trace = qEnvironmentVariableIntValue("CLUSTERSTAT_TRACE") == 1;
    std::vector<QByteArray> args = commandArguments(argc, argv, trace);
    clusterstat::logging::initLogging(QStringLiteral("clusterstat"), trace);

    const clusterstat::logging::CorrelationScope scope(
        clusterstat::logging::newCorrelationId(QStringLiteral("cli")));
    CLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("stats_cli_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              clusterstat::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"args", args.size()}, {"trace", trace}}));

    std::vector<char *> rawArgs;
    rawArgs.reserve(args.size());
    for (auto &arg : args) {
        rawArgs.push_back(arg.data());
    }

    // Collection passes spin their own event loops; app.exec() is not needed.
    clusterstat::StatsCli cli;
    const int exitCode = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    CLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("stats_cli_exit"),
              QStringLiteral("command_finished"),
              QStringLiteral("cli"),
              clusterstat::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"exitCode", exitCode}}));
    return exitCode;
}

#pragma once

#include <functional>
#include <iostream>
#include <optional>
#include <ostream>

#include <QString>
#include <QStringList>

#include "collector/collector.hpp"
#include "common/settings.hpp"
#include "diff/diff_engine.hpp"
#include "report/report_renderer.hpp"

namespace clusterstat {

class StatsCli
{
public:
    // Blocks until the operator is ready for the end pass of an adhoc diff.
    using WaitFunction = std::function<void()>;

    StatsCli(std::ostream &out = std::cout,
             std::ostream &err = std::cerr,
             WaitFunction waitForOperator = {});

    // returns exit code
    int run(int argc, char *argv[]);

private:
    // Everything the subcommands share, resolved once from the arguments.
    struct Invocation {
        QStringList args;
        ConfigResolution config;
        std::vector<EndpointKind> kinds;
        std::optional<std::regex> hostnameFilter;
        RenderOptions render;
        DiffOptions diff;
        bool silent = false;
    };

    int runSnapshot(const Invocation &invocation);
    int runList(const Invocation &invocation);
    int runDiff(const Invocation &invocation);
    int runAdhocDiff(const Invocation &invocation);
    int runPrint(const Invocation &invocation);

    std::optional<Invocation> parseInvocation(const QStringList &args);
    CollectorOptions collectorOptions(const Invocation &invocation) const;
    int usageError();

    std::ostream &m_out;
    std::ostream &m_err;
    WaitFunction m_waitForOperator;
};

} // namespace clusterstat

#include "common/settings.hpp"

#include <QByteArray>
#include <QString>

namespace clusterstat {

namespace {

std::optional<std::string> environmentValue(const char *name)
{
    const QByteArray value = qgetenv(name);
    if (value.isEmpty()) {
        return std::nullopt;
    }
    return value.toStdString();
}

std::optional<int> parsePositive(const std::string &value)
{
    bool ok = false;
    const int parsed = QString::fromStdString(value).trimmed().toInt(&ok);
    if (!ok || parsed < 1) {
        return std::nullopt;
    }
    return parsed;
}

// Command line first, then the environment.
std::optional<std::string> pick(const std::optional<std::string> &cli,
                                const char *envName,
                                ConfigResolution &resolution)
{
    if (cli.has_value()) {
        resolution.changedOptions[envName] = *cli;
        return cli;
    }
    return environmentValue(envName);
}

} // namespace

ConfigResolution resolveSettings(const SettingsOverrides &overrides)
{
    ConfigResolution resolution;
    Settings &settings = resolution.settings;

    if (auto hosts = pick(overrides.hosts, "CLUSTERSTAT_HOSTS", resolution)) {
        settings.hosts = *hosts;
    }
    if (auto ports = pick(overrides.ports, "CLUSTERSTAT_PORTS", resolution)) {
        settings.ports = *ports;
    }
    if (auto parallel = pick(overrides.parallel, "CLUSTERSTAT_PARALLEL", resolution)) {
        if (const auto value = parsePositive(*parallel)) {
            settings.parallel = *value;
        } else {
            resolution.warnings.push_back("invalid parallel value '" + *parallel
                                          + "', using 1");
            settings.parallel = 1;
        }
    }
    if (auto root = pick(overrides.snapshotRoot, "CLUSTERSTAT_SNAPSHOT_ROOT", resolution)) {
        settings.snapshotRoot = *root;
    }
    if (auto timeout = pick(overrides.timeoutMs, "CLUSTERSTAT_TIMEOUT_MS", resolution)) {
        if (const auto value = parsePositive(*timeout)) {
            settings.requestTimeoutMs = *value;
        } else {
            resolution.warnings.push_back("invalid timeout value '" + *timeout
                                          + "', using "
                                          + std::to_string(settings.requestTimeoutMs));
        }
    }
    if (overrides.uuid.has_value()) {
        settings.uuid = *overrides.uuid;
    }

    settings.useTls = overrides.useTls
        || qEnvironmentVariableIntValue("CLUSTERSTAT_TLS") == 1;

    return resolution;
}

} // namespace clusterstat

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace clusterstat {

struct Settings {
    // Comma separated lists, split by the endpoint resolver.
    std::string hosts = "192.168.66.80,192.168.66.81,192.168.66.82";
    std::string ports = "7000,9000,12000,13000,9300";
    int parallel = 1;
    int probeTimeoutMs = 1000;
    int requestTimeoutMs = 10000;
    bool useTls = false;
    std::string snapshotRoot = "clusterstat.snapshots";
    // Substituted into table-detail and tablet-detail paths.
    std::string uuid;
};

// Values given on the command line. Unset values fall back to the
// environment and then to the defaults.
struct SettingsOverrides {
    std::optional<std::string> hosts;
    std::optional<std::string> ports;
    std::optional<std::string> parallel;
    std::optional<std::string> snapshotRoot;
    std::optional<std::string> timeoutMs;
    std::optional<std::string> uuid;
    bool useTls = false;
};

/**
 * Outcome of resolving the settings for one invocation.
 * changedOptions lists the environment style names (CLUSTERSTAT_HOSTS, ...)
 * of every option given on the command line, with its value.
 */
struct ConfigResolution {
    Settings settings;
    std::map<std::string, std::string> changedOptions;
    std::vector<std::string> warnings;
};

ConfigResolution resolveSettings(const SettingsOverrides &overrides);

} // namespace clusterstat

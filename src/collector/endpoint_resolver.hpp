#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace clusterstat {

// Split a comma separated list; items are trimmed and empty items dropped.
std::vector<std::string> splitList(const std::string &text);

// Ports that parse as 1..65535, duplicates removed, first occurrence kept.
std::vector<int> parsePortList(const std::string &text);

/**
 * Build the work list for one kind: every host crossed with every
 * configured port the kind is served on. When a hostname filter is given
 * it is matched against "host:port" before anything is fetched.
 * Kinds whose path needs a uuid resolve to an empty list without one.
 */
std::vector<Endpoint> resolveWorkList(EndpointKind kind,
                                      const std::string &hosts,
                                      const std::string &ports,
                                      const std::optional<std::regex> &hostnameFilter,
                                      const std::string &uuid = {});

// Path of the kind's endpoint with the uuid placeholder substituted.
std::string endpointPath(EndpointKind kind, const std::string &uuid);

} // namespace clusterstat

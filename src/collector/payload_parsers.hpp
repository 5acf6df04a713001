#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/kind_registry.hpp"

namespace clusterstat {

using PayloadRow = std::map<std::string, std::string>;

/**
 * Turn one HTTP body into rows of the kind's columns.
 *
 * Returns std::nullopt when the body is not a payload of the expected
 * format (the collector substitutes a synthetic record). A valid payload
 * without data yields an empty vector.
 */
std::optional<std::vector<PayloadRow>> parsePayload(const KindSchema &schema,
                                                    const std::string &body);

// Text content of an html fragment: tags removed, entities decoded,
// whitespace collapsed.
std::string htmlToText(const std::string &html);

} // namespace clusterstat

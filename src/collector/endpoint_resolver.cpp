#include "collector/endpoint_resolver.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

#include "common/kind_registry.hpp"
#include "common/logging.hpp"

namespace clusterstat {

namespace {

constexpr const char *kUuidPlaceholder = "{uuid}";

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

} // namespace

std::vector<std::string> splitList(const std::string &text)
{
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos) {
            comma = text.size();
        }
        std::string item = trim(text.substr(start, comma - start));
        if (!item.empty()
            && std::find(items.begin(), items.end(), item) == items.end()) {
            items.push_back(std::move(item));
        }
        start = comma + 1;
    }
    return items;
}

std::vector<int> parsePortList(const std::string &text)
{
    std::vector<int> ports;
    for (const auto &item : splitList(text)) {
        int port = 0;
        try {
            size_t used = 0;
            port = std::stoi(item, &used);
            if (used != item.size()) {
                port = 0;
            }
        } catch (const std::exception &) {
            port = 0;
        }
        if (port < 1 || port > 65535) {
            CLOG_WARN(QStringLiteral("EndpointResolver"),
                      QStringLiteral("parsePortList"),
                      QStringLiteral("port_ignored"),
                      QStringLiteral("not_a_port_number"),
                      QStringLiteral("config"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"value", item}}));
            continue;
        }
        if (std::find(ports.begin(), ports.end(), port) == ports.end()) {
            ports.push_back(port);
        }
    }
    return ports;
}

std::string endpointPath(EndpointKind kind, const std::string &uuid)
{
    std::string path = schemaFor(kind).path;
    const auto pos = path.find(kUuidPlaceholder);
    if (pos != std::string::npos) {
        path.replace(pos, std::char_traits<char>::length(kUuidPlaceholder), uuid);
    }
    return path;
}

std::vector<Endpoint> resolveWorkList(EndpointKind kind,
                                      const std::string &hosts,
                                      const std::string &ports,
                                      const std::optional<std::regex> &hostnameFilter,
                                      const std::string &uuid)
{
    const KindSchema &schema = schemaFor(kind);
    if (schema.path.find(kUuidPlaceholder) != std::string::npos && uuid.empty()) {
        CLOG_DEBUG(QStringLiteral("EndpointResolver"),
                   QStringLiteral("resolveWorkList"),
                   QStringLiteral("kind_skipped"),
                   QStringLiteral("uuid_required"),
                   QStringLiteral("config"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"kind", schema.name}}));
        return {};
    }

    std::vector<int> kindPorts;
    for (const int port : parsePortList(ports)) {
        if (schema.ports.empty()
            || std::find(schema.ports.begin(), schema.ports.end(), port)
                != schema.ports.end()) {
            kindPorts.push_back(port);
        }
    }

    std::vector<Endpoint> workList;
    for (const auto &host : splitList(hosts)) {
        for (const int port : kindPorts) {
            Endpoint endpoint{host, port};
            if (hostnameFilter.has_value()
                && !std::regex_search(endpoint.hostnamePort(), *hostnameFilter)) {
                continue;
            }
            workList.push_back(std::move(endpoint));
        }
    }
    return workList;
}

} // namespace clusterstat

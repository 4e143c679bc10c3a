#include "RouteTable.hpp"

#include <algorithm>
#include <stdexcept>

RouteTable::RouteTable(std::vector<RouteEntry> routes) : routes_(std::move(routes)) {
    for (const auto& route : routes_) {
        if (route.path_prefix.empty() || route.path_prefix.front() != '/') {
            throw std::invalid_argument("Route prefix must start with '/': '" + route.path_prefix + "'");
        }
        if (route.service_name.empty()) {
            throw std::invalid_argument("Route '" + route.path_prefix + "' has no service name");
        }
    }
    // Longest prefix first so the first match is the best one.
    std::stable_sort(routes_.begin(), routes_.end(), [](const RouteEntry& a, const RouteEntry& b) {
        return a.path_prefix.size() > b.path_prefix.size();
    });
}

std::optional<RouteMatch> RouteTable::match(const std::string& target) const {
    std::string path = target.substr(0, target.find('?'));
    for (const auto& route : routes_) {
        if (prefixMatches(route.path_prefix, path)) {
            return RouteMatch{route.service_name, route.path_prefix, stripPrefix(route.path_prefix, target)};
        }
    }
    return std::nullopt;
}

bool RouteTable::prefixMatches(const std::string& prefix, const std::string& path) {
    if (prefix.empty() || path.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return path.size() == prefix.size() || prefix.back() == '/' || path[prefix.size()] == '/';
}

std::string RouteTable::stripPrefix(const std::string& prefix, const std::string& target) {
    size_t query_pos = target.find('?');
    std::string path = target.substr(0, query_pos);
    std::string query = query_pos == std::string::npos ? "" : target.substr(query_pos);

    std::string remainder = path.size() > prefix.size() ? path.substr(prefix.size()) : "";
    if (remainder.empty() || remainder.front() != '/') {
        remainder.insert(remainder.begin(), '/');
    }
    return remainder + query;
}

#ifndef ROUTETABLE_HPP
#define ROUTETABLE_HPP

#include <optional>
#include <string>
#include <vector>

#include "../models/RouteEntry.hpp"

struct RouteMatch {
    std::string service_name;
    std::string path_prefix;
    // Path relative to the service, query string included.
    std::string forward_target;
};

// Immutable after construction. A prefix matches a path that equals it or
// continues with '/' after it; the longest matching prefix wins.
class RouteTable {
public:
    explicit RouteTable(std::vector<RouteEntry> routes);

    std::optional<RouteMatch> match(const std::string& target) const;

    const std::vector<RouteEntry>& routes() const { return routes_; }

    static bool prefixMatches(const std::string& prefix, const std::string& path);

    // Removes `prefix` from `target`. The result always starts with '/'.
    static std::string stripPrefix(const std::string& prefix, const std::string& target);

private:
    std::vector<RouteEntry> routes_;
};

#endif // ROUTETABLE_HPP

#pragma once

#include <string>

// Maps an inbound path prefix to a logical backend service.
struct RouteEntry {
    std::string path_prefix;
    std::string service_name;
};

// Per-route admission override.
struct RateLimitRule {
    double per_minute = 0.0;
    int burst = 0;
};

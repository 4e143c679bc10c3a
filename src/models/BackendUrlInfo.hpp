#pragma once

#include <string>

// One resolved backend instance.
struct BackendUrlInfo {
    std::string url;
    std::string backend_host;
    int backend_port = 80;
    bool is_https = false;

    bool operator==(const BackendUrlInfo& other) const {
        return url == other.url;
    }

    bool operator!=(const BackendUrlInfo& other) const {
        return !(*this == other);
    }

    // Value for the outbound Host header; the port is omitted when it is the scheme default.
    std::string hostHeader() const {
        bool default_port = (is_https && backend_port == 443) || (!is_https && backend_port == 80);
        return default_port ? backend_host : backend_host + ":" + std::to_string(backend_port);
    }
};

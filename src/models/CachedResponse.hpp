#pragma once

#include <string>

#include <nlohmann/json.hpp>

struct CachedResponse {
    int status_code = 200;
    std::string body;
    std::string content_type;
};

inline void to_json(nlohmann::json& j, const CachedResponse& response) {
    j = nlohmann::json{
        {"status_code", response.status_code},
        {"body", response.body},
        {"content_type", response.content_type}
    };
}

inline void from_json(const nlohmann::json& j, CachedResponse& response) {
    j.at("status_code").get_to(response.status_code);
    j.at("body").get_to(response.body);
    response.content_type = j.value("content_type", std::string());
}

#pragma once

#include <string>

#include <boost/beast/http.hpp>

// An inbound request on its way to a backend service. The target is
// already relative to the service (route prefix stripped).
struct ProxyRequest {
    boost::beast::http::request<boost::beast::http::string_body> message;
    std::string client_address;
};

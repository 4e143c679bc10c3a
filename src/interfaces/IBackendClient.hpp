#ifndef IBACKENDCLIENT_HPP
#define IBACKENDCLIENT_HPP

#include <optional>

#include <boost/beast/core/error.hpp>
#include <boost/beast/http.hpp>

#include "../models/BackendUrlInfo.hpp"
#include "../resilience/Deadline.hpp"

struct BackendCallResult {
    std::optional<boost::beast::http::response<boost::beast::http::string_body>> response;
    boost::beast::error_code error;
};

class IBackendClient {
public:
    virtual ~IBackendClient() = default;

    // Sends one request to `backend` and blocks until a response arrives,
    // the transport fails or the deadline fires.
    virtual BackendCallResult send(const BackendUrlInfo& backend,
                                   boost::beast::http::request<boost::beast::http::string_body> request,
                                   Deadline& deadline) = 0;

    // Aborts every call in flight.
    virtual void cancelAll() = 0;
};

#endif // IBACKENDCLIENT_HPP

#ifndef ISERVICELOCATOR_HPP
#define ISERVICELOCATOR_HPP

#include <optional>
#include <string>
#include <vector>

#include "../models/BackendUrlInfo.hpp"

class IServiceLocator {
public:
    virtual ~IServiceLocator() = default;

    // Picks one healthy instance of the service, or nullopt if none is available.
    virtual std::optional<BackendUrlInfo> resolveHealthy(const std::string& service_name) = 0;

    virtual std::vector<BackendUrlInfo> resolveAll(const std::string& service_name) = 0;

    // Passive health signal: the instance failed at the transport level.
    virtual void reportFailure(const std::string& service_name, const BackendUrlInfo& instance) = 0;
};

#endif // ISERVICELOCATOR_HPP

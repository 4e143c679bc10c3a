#ifndef STATICSERVICELOCATOR_HPP
#define STATICSERVICELOCATOR_HPP

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IServiceLocator.hpp"

// Serves the instances listed in configuration. Instances reported as
// failed are skipped until their quarantine runs out.
class StaticServiceLocator : public IServiceLocator {
public:
    StaticServiceLocator(std::map<std::string, std::vector<BackendUrlInfo>> services,
                         std::chrono::milliseconds quarantine_duration,
                         std::shared_ptr<ILogger> logger);

    std::optional<BackendUrlInfo> resolveHealthy(const std::string& service_name) override;
    std::vector<BackendUrlInfo> resolveAll(const std::string& service_name) override;
    void reportFailure(const std::string& service_name, const BackendUrlInfo& instance) override;

    std::vector<std::string> serviceNames() const;

private:
    using clock = std::chrono::steady_clock;

    // Callers hold mutex_.
    std::vector<BackendUrlInfo> healthyInstances(const std::string& service_name, clock::time_point now);

    std::map<std::string, std::vector<BackendUrlInfo>> services_;
    std::chrono::milliseconds quarantine_duration_;
    std::shared_ptr<ILogger> logger_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> next_index_;               // Key: service name
    std::unordered_map<std::string, clock::time_point> quarantined_;   // Key: instance url
};

#endif // STATICSERVICELOCATOR_HPP

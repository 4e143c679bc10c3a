#include "StaticServiceLocator.hpp"

#include <stdexcept>

StaticServiceLocator::StaticServiceLocator(std::map<std::string, std::vector<BackendUrlInfo>> services,
                                           std::chrono::milliseconds quarantine_duration,
                                           std::shared_ptr<ILogger> logger)
    : services_(std::move(services)), quarantine_duration_(quarantine_duration), logger_(logger) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for StaticServiceLocator");
    }
    if (quarantine_duration_ < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Instance quarantine duration must be >= 0");
    }
}

std::optional<BackendUrlInfo> StaticServiceLocator::resolveHealthy(const std::string& service_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto healthy = healthyInstances(service_name, clock::now());
    if (healthy.empty()) {
        logger_->warn("No healthy instance available for service: " + service_name);
        return std::nullopt;
    }
    size_t& index = next_index_[service_name];
    BackendUrlInfo selected = healthy[index % healthy.size()];
    ++index;
    return selected;
}

std::vector<BackendUrlInfo> StaticServiceLocator::resolveAll(const std::string& service_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return healthyInstances(service_name, clock::now());
}

void StaticServiceLocator::reportFailure(const std::string& service_name, const BackendUrlInfo& instance) {
    if (quarantine_duration_ == std::chrono::milliseconds::zero()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    quarantined_[instance.url] = clock::now() + quarantine_duration_;
    logger_->warn("Quarantining instance " + instance.url + " of service " + service_name + " for " +
                  std::to_string(quarantine_duration_.count()) + "ms");
}

std::vector<std::string> StaticServiceLocator::serviceNames() const {
    std::vector<std::string> names;
    names.reserve(services_.size());
    for (const auto& [name, instances] : services_) {
        names.push_back(name);
    }
    return names;
}

std::vector<BackendUrlInfo> StaticServiceLocator::healthyInstances(const std::string& service_name,
                                                                   clock::time_point now) {
    std::vector<BackendUrlInfo> healthy;
    auto it = services_.find(service_name);
    if (it == services_.end()) {
        return healthy;
    }
    for (const auto& instance : it->second) {
        auto quarantined_it = quarantined_.find(instance.url);
        if (quarantined_it != quarantined_.end()) {
            if (quarantined_it->second > now) {
                continue;
            }
            quarantined_.erase(quarantined_it);
        }
        healthy.push_back(instance);
    }
    return healthy;
}

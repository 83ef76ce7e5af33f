#include "resilience/service_locator.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace toolgate::resilience {

std::string to_string(const Readiness readiness) {
    switch (readiness) {
        case Readiness::NotStarted:
            return "not_started";
        case Readiness::Initializing:
            return "initializing";
        case Readiness::Ready:
            return "ready";
        case Readiness::Crashed:
            return "crashed";
        default:
            return "unknown";
    }
}

ServiceHandle::ServiceHandle(std::string name) : name_(std::move(name)) {}

const std::string& ServiceHandle::name() const {
    return name_;
}

Readiness ServiceHandle::readiness() const {
    return readiness_.load();
}

bool ServiceHandle::is_alive() const {
    return readiness() != Readiness::Crashed;
}

void ServiceHandle::set_readiness(const Readiness readiness) {
    const Readiness previous = readiness_.exchange(readiness);
    if (previous != readiness) {
        LOG_DEBUG("Service " + name_ + " transition " + to_string(previous) + " -> " +
                  to_string(readiness));
    }
}

void ServiceLocator::register_service(const std::shared_ptr<ServiceHandle>& handle) {
    if (!handle) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    services_[handle->name()] = handle;
}

void ServiceLocator::unregister_service(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    services_.erase(name);
}

bool ServiceLocator::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return services_.find(name) != services_.end();
}

std::vector<std::string> ServiceLocator::names() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        names.reserve(services_.size());
        for (const auto& entry : services_) {
            names.push_back(entry.first);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace toolgate::resilience

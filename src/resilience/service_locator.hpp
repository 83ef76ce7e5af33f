#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolgate::resilience {

enum class Readiness {
    NotStarted,
    Initializing,
    Ready,
    Crashed
};

std::string to_string(Readiness readiness);

// Base of every collaborator handle the gateway talks to. The handle owns its
// readiness; callers never infer readiness from mere existence.
class ServiceHandle {
public:
    explicit ServiceHandle(std::string name);
    virtual ~ServiceHandle() = default;

    ServiceHandle(const ServiceHandle&) = delete;
    ServiceHandle& operator=(const ServiceHandle&) = delete;

    const std::string& name() const;

    virtual Readiness readiness() const;
    virtual bool is_alive() const;

    void set_readiness(Readiness readiness);

private:
    std::string name_;
    std::atomic<Readiness> readiness_{Readiness::NotStarted};
};

enum class ResolutionStatus {
    Resolved,
    NotRegistered,
    NotReady,
    NotAlive,
    WrongType
};

template <typename T>
struct Resolution {
    ResolutionStatus status = ResolutionStatus::NotRegistered;
    std::shared_ptr<T> handle;
};

// Classifies a weak handle: expired or crashed is NotAlive, a handle that has
// not finished starting is NotReady.
template <typename T>
Resolution<T> inspect_handle(const std::weak_ptr<T>& weak) {
    Resolution<T> resolution;
    resolution.handle = weak.lock();
    if (!resolution.handle) {
        resolution.status = ResolutionStatus::NotAlive;
        return resolution;
    }

    const Readiness readiness = resolution.handle->readiness();
    if (readiness == Readiness::NotStarted || readiness == Readiness::Initializing) {
        resolution.status = ResolutionStatus::NotReady;
        resolution.handle.reset();
        return resolution;
    }
    if (readiness == Readiness::Crashed || !resolution.handle->is_alive()) {
        resolution.status = ResolutionStatus::NotAlive;
        resolution.handle.reset();
        return resolution;
    }
    resolution.status = ResolutionStatus::Resolved;
    return resolution;
}

// Name -> handle routing table. Holds handles weakly: registering a service
// never extends its lifetime.
class ServiceLocator {
public:
    void register_service(const std::shared_ptr<ServiceHandle>& handle);
    void unregister_service(const std::string& name);
    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

    template <typename T>
    Resolution<T> resolve(const std::string& name) const {
        std::weak_ptr<ServiceHandle> weak;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = services_.find(name);
            if (it == services_.end()) {
                return Resolution<T>{ResolutionStatus::NotRegistered, nullptr};
            }
            weak = it->second;
        }

        auto base = inspect_handle(weak);
        if (base.status != ResolutionStatus::Resolved) {
            return Resolution<T>{base.status, nullptr};
        }
        auto typed = std::dynamic_pointer_cast<T>(base.handle);
        if (!typed) {
            return Resolution<T>{ResolutionStatus::WrongType, nullptr};
        }
        return Resolution<T>{ResolutionStatus::Resolved, std::move(typed)};
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::weak_ptr<ServiceHandle>> services_;
};

}  // namespace toolgate::resilience

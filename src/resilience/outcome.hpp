#pragma once

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace toolgate::resilience {

// Set when the caller stops waiting for a worker. Long-running work should
// poll it and return early.
using CancelToken = std::shared_ptr<std::atomic_bool>;

// Why a bounded call did or did not produce a value. The defensive layer
// returns these; it never lets the underlying fault escape.
template <typename T>
struct Ok {
    T value;
};
struct NotReady {};
struct NotAlive {};
struct Timeout {};
struct Exited {
    std::string reason;
};
struct Exception {
    std::string message;
};
struct FallbackFailed {
    std::string message;
};

template <typename T>
using Outcome =
    std::variant<Ok<T>, NotReady, NotAlive, Timeout, Exited, Exception, FallbackFailed>;

// Thrown by a service handle whose peer went away in the middle of a call.
class ServiceExited : public std::runtime_error {
public:
    explicit ServiceExited(const std::string& reason) : std::runtime_error(reason) {}
};

template <typename T>
bool is_ok(const Outcome<T>& outcome) {
    return std::holds_alternative<Ok<T>>(outcome);
}

template <typename T>
const T& get_ok(const Outcome<T>& outcome) {
    return std::get<Ok<T>>(outcome).value;
}

template <typename T>
T take_ok(Outcome<T>&& outcome) {
    return std::move(std::get<Ok<T>>(outcome).value);
}

// Short tag of a non-Ok outcome, e.g. "timeout" or "exited: status 3".
template <typename T>
std::string describe(const Outcome<T>& outcome) {
    return std::visit(
        [](const auto& value) -> std::string {
            using V = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<V, Ok<T>>) {
                return "ok";
            } else if constexpr (std::is_same_v<V, NotReady>) {
                return "not_ready";
            } else if constexpr (std::is_same_v<V, NotAlive>) {
                return "not_alive";
            } else if constexpr (std::is_same_v<V, Timeout>) {
                return "timeout";
            } else if constexpr (std::is_same_v<V, Exited>) {
                return "exited: " + value.reason;
            } else if constexpr (std::is_same_v<V, Exception>) {
                return "exception: " + value.message;
            } else {
                return "fallback_failed: " + value.message;
            }
        },
        outcome);
}

}  // namespace toolgate::resilience

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>
#include "core/errors/gateway_errors.hpp"
#include "core/logging/logger.hpp"
#include "resilience/outcome.hpp"
#include "resilience/service_locator.hpp"
#include "resilience/worker_tracker.hpp"
#include "runtime/background_jobs.hpp"

namespace toolgate::resilience {

struct FallbackOptions {
    std::chrono::milliseconds timeout{5000};
    std::string label = "primary";
};

namespace detail {

template <typename Fn>
decltype(auto) invoke_with_token(Fn& fn, const CancelToken& token) {
    if constexpr (std::is_invocable_v<Fn&, const CancelToken&>) {
        return fn(token);
    } else {
        return fn();
    }
}

template <typename Fn>
using worker_result_t = std::decay_t<decltype(invoke_with_token(
    std::declval<Fn&>(), std::declval<const CancelToken&>()))>;

template <typename Handle, typename Fn>
decltype(auto) invoke_on_handle(Fn& fn, Handle& handle, const CancelToken& token) {
    if constexpr (std::is_invocable_v<Fn&, Handle&, const CancelToken&>) {
        return fn(handle, token);
    } else {
        return fn(handle);
    }
}

template <typename Handle, typename Fn>
using handle_result_t = std::decay_t<decltype(invoke_on_handle<Handle>(
    std::declval<Fn&>(), std::declval<Handle&>(), std::declval<const CancelToken&>()))>;

template <typename T>
struct WorkerState {
    std::mutex mutex;
    std::condition_variable done_cv;
    bool done = false;
    std::optional<Outcome<T>> outcome;
};

// Runs `call` and turns whatever it throws into an outcome value.
template <typename T, typename Call>
Outcome<T> run_guarded(Call&& call) {
    try {
        return Ok<T>{call()};
    } catch (const ServiceExited& e) {
        return Exited{e.what()};
    } catch (const std::exception& e) {
        return Exception{e.what()};
    } catch (...) {
        return Exception{"unknown exception"};
    }
}

template <typename Handle, typename Fn>
Outcome<handle_result_t<Handle, Fn>> call_resolved(Resolution<Handle> resolution,
                                                    const std::string& target_name,
                                                    Fn message,
                                                    std::chrono::milliseconds timeout);

template <typename Handle, typename Fn>
core::errors::Status to_status(Fn& message, Handle& handle) {
    using R = std::invoke_result_t<Fn&, Handle&>;
    if constexpr (std::is_void_v<R>) {
        message(handle);
        return core::errors::ok_status();
    } else {
        const auto result = message(handle);
        if (core::errors::is_error(result)) {
            return core::errors::get_error(result);
        }
        return core::errors::ok_status();
    }
}

}  // namespace detail

// Runs `fn` on a dedicated worker and waits at most `timeout` for it. `fn`
// may take a CancelToken; on timeout the token is set and the worker is
// abandoned, so `fn` must own (or share) everything it touches.
template <typename Fn>
Outcome<detail::worker_result_t<Fn>> with_timeout(Fn fn, const std::chrono::milliseconds timeout) {
    using T = detail::worker_result_t<Fn>;
    auto state = std::make_shared<detail::WorkerState<T>>();
    auto token = std::make_shared<std::atomic_bool>(false);

    WorkerTracker::get().started();
    std::thread worker;
    try {
        worker = std::thread([state, token, fn = std::move(fn)]() mutable {
            {
                // Whatever the call captured is released before the worker
                // reports itself finished.
                auto task = std::move(fn);
                Outcome<T> outcome = detail::run_guarded<T>(
                    [&task, &token]() { return detail::invoke_with_token(task, token); });
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->outcome = std::move(outcome);
                    state->done = true;
                }
                state->done_cv.notify_all();
            }
            WorkerTracker::get().finished();
        });
    } catch (const std::system_error& e) {
        WorkerTracker::get().finished();
        return Exception{std::string("failed to start worker: ") + e.what()};
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    const bool finished =
        state->done_cv.wait_for(lock, timeout, [&state]() { return state->done; });
    if (!finished) {
        lock.unlock();
        token->store(true);
        worker.detach();
        return Timeout{};
    }
    Outcome<T> outcome = std::move(state->outcome.value());
    lock.unlock();
    worker.join();
    return outcome;
}

// Runs `primary` (returning Result<T>) under with_timeout. Any failure of the
// primary (error result, fault or timeout) runs `fallback` once.
template <typename Primary, typename Fallback>
auto with_fallback(Primary primary, Fallback fallback, const FallbackOptions& options)
    -> Outcome<std::decay_t<std::invoke_result_t<Fallback&>>> {
    using T = std::decay_t<std::invoke_result_t<Fallback&>>;

    auto primary_outcome = with_timeout(std::move(primary), options.timeout);
    std::string reason;
    if (is_ok(primary_outcome)) {
        auto result = take_ok(std::move(primary_outcome));
        if (!core::errors::is_error(result)) {
            return Ok<T>{std::get<T>(std::move(result))};
        }
        reason = "failed: " + core::errors::get_error(result).message;
    } else {
        reason = describe(primary_outcome);
    }
    LOG_WARN("with_fallback: " + options.label + " " + reason + ", using fallback");

    try {
        return Ok<T>{fallback()};
    } catch (const std::exception& e) {
        return FallbackFailed{e.what()};
    } catch (...) {
        return FallbackFailed{"unknown exception"};
    }
}

// Bounded synchronous call on a named service resolved through `locator`.
// `message` receives the typed handle (and optionally the CancelToken).
template <typename Handle, typename Fn>
Outcome<detail::handle_result_t<Handle, Fn>> safe_call(const ServiceLocator& locator,
                                                       const std::string& name,
                                                       Fn message,
                                                       const std::chrono::milliseconds timeout) {
    return detail::call_resolved<Handle>(locator.resolve<Handle>(name), name, std::move(message),
                                         timeout);
}

// Same as above for a handle held by weak reference.
template <typename Handle, typename Fn>
Outcome<detail::handle_result_t<Handle, Fn>> safe_call(const std::weak_ptr<Handle>& target,
                                                       Fn message,
                                                       const std::chrono::milliseconds timeout) {
    auto resolution = inspect_handle(target);
    const std::string name = resolution.handle ? resolution.handle->name() : "<weak handle>";
    return detail::call_resolved<Handle>(std::move(resolution), name, std::move(message), timeout);
}

// Fire-and-forget: resolves like safe_call, then hands `message` to the
// background pool without waiting. `message` returns void or a Result.
template <typename Handle, typename Fn>
Outcome<std::monostate> safe_cast(const ServiceLocator& locator, const std::string& name,
                                  Fn message, runtime::BackgroundJobs& jobs) {
    auto resolution = locator.resolve<Handle>(name);
    switch (resolution.status) {
        case ResolutionStatus::NotRegistered:
        case ResolutionStatus::NotReady:
            LOG_DEBUG("safe_cast: " + name + " not ready");
            return NotReady{};
        case ResolutionStatus::NotAlive:
            LOG_DEBUG("safe_cast: " + name + " not alive");
            return NotAlive{};
        case ResolutionStatus::WrongType:
            return Exception{"service '" + name + "' does not provide the requested interface"};
        case ResolutionStatus::Resolved:
            break;
    }

    auto handle = std::move(resolution.handle);
    const bool queued = jobs.submit(name, [handle, message = std::move(message)]() mutable {
        return detail::to_status<Handle>(message, *handle);
    });
    if (!queued) {
        LOG_DEBUG("safe_cast: job for " + name + " discarded");
    }
    return Ok<std::monostate>{};
}

namespace detail {

template <typename Handle, typename Fn>
Outcome<handle_result_t<Handle, Fn>> call_resolved(Resolution<Handle> resolution,
                                                    const std::string& target_name,
                                                    Fn message,
                                                    const std::chrono::milliseconds timeout) {
    switch (resolution.status) {
        case ResolutionStatus::NotRegistered:
        case ResolutionStatus::NotReady:
            LOG_DEBUG("safe_call: " + target_name + " not ready");
            return NotReady{};
        case ResolutionStatus::NotAlive:
            LOG_DEBUG("safe_call: " + target_name + " not alive");
            return NotAlive{};
        case ResolutionStatus::WrongType:
            return Exception{"service '" + target_name +
                             "' does not provide the requested interface"};
        case ResolutionStatus::Resolved:
            break;
    }

    auto handle = std::move(resolution.handle);
    auto outcome = with_timeout(
        [handle, message = std::move(message)](const CancelToken& token) mutable {
            return invoke_on_handle<Handle>(message, *handle, token);
        },
        timeout);
    if (std::holds_alternative<Timeout>(outcome)) {
        LOG_WARN("safe_call: " + target_name + " timed out after " +
                 std::to_string(timeout.count()) + " ms");
    }
    return outcome;
}

}  // namespace detail

}  // namespace toolgate::resilience

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include "core/errors/gateway_errors.hpp"
#include "resilience/defensive.hpp"
#include "resilience/service_locator.hpp"
#include "skills/skill_catalog.hpp"

namespace toolgate::skills {

// A live connection to one skill process: line-delimited JSON-RPC over the
// child's stdin/stdout. The child's stderr is inherited.
class SkillChannel : public resilience::ServiceHandle {
public:
    explicit SkillChannel(SkillSpec spec);
    ~SkillChannel() override;

    const SkillSpec& spec() const { return spec_; }

    // NotStarted -> Initializing -> Ready, or Crashed if the process cannot
    // be spawned or does not answer `initialize` within `connect_timeout`.
    core::errors::Status start(std::chrono::milliseconds connect_timeout);

    // Starts the process on first use; fails for a crashed channel.
    core::errors::Status ensure_started(std::chrono::milliseconds connect_timeout);

    // Sends one request and waits for the response with the same id. Throws
    // resilience::ServiceExited if the process goes away mid-call.
    core::errors::Result<nlohmann::json> request(const std::string& method,
                                                 const nlohmann::json& params,
                                                 std::chrono::milliseconds timeout,
                                                 const resilience::CancelToken& cancel_token);

    // Reports Crashed as soon as the process has exited.
    resilience::Readiness readiness() const override;

    // Closes stdin, gives the process a moment to exit, then kills it.
    void close();

    pid_t pid() const;

private:
    core::errors::Result<nlohmann::json> request_locked(const std::string& method,
                                                        const nlohmann::json& params,
                                                        std::chrono::milliseconds timeout,
                                                        const resilience::CancelToken& cancel_token);
    // Consumes complete buffered lines up to the response carrying
    // `expected_id`; nullopt when no such line is buffered yet.
    std::optional<core::errors::Result<nlohmann::json>> take_response_locked(
        const nlohmann::json& expected_id);
    void write_line_locked(const std::string& line);
    // Kills (if needed) and reaps the process, closes both pipes.
    void mark_exited_locked();
    void close_locked();
    bool reap_locked(bool block) const;
    std::string exit_reason_locked() const;

    SkillSpec spec_;
    std::mutex io_mutex_;
    mutable std::mutex process_mutex_;
    mutable pid_t pid_ = -1;
    mutable int exit_status_ = -1;
    mutable bool exited_ = false;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::string read_buffer_;
    std::int64_t next_id_ = 1;
};

}  // namespace toolgate::skills

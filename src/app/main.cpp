#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "collaborators/jsonl_memory_store.hpp"
#include "collaborators/skill_consultant.hpp"
#include "core/config/id_generator.hpp"
#include "core/config/timeouts.hpp"
#include "core/errors/gateway_errors.hpp"
#include "core/logging/logger.hpp"
#include "handlers/internal_handlers.hpp"
#include "registry/router.hpp"
#include "registry/tool_registry.hpp"
#include "resilience/service_locator.hpp"
#include "resilience/worker_tracker.hpp"
#include "runtime/background_jobs.hpp"
#include "server/dispatcher.hpp"
#include "server/protocol_loop.hpp"
#include "skills/skill_catalog.hpp"
#include "skills/skill_client.hpp"
#include "skills/skill_supervisor.hpp"

int main(int argc, char* argv[]) {
    // 1. Session id for every diagnostic line of this process
    toolgate::core::logging::Logger::get().set_session_id(
        toolgate::core::config::generate_id("gw-"));

    // 2. Parse CLI input and return normalized input errors
    auto parsed = toolgate::app::cli::parse_and_validate(argc, argv);
    if (toolgate::core::errors::is_error(parsed)) {
        const auto& err = toolgate::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_ERROR("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = toolgate::core::errors::get_value(parsed);
    toolgate::core::logging::Logger::get().set_level(options.log_level);
    LOG_INFO("Gateway: bootstrapping...");

    // 3. Timeouts, locator and background pool
    auto timeouts = std::make_shared<toolgate::core::config::TimeoutHierarchy>();
    for (const auto& violation : timeouts->ordering_violations()) {
        LOG_WARN("Timeout ordering: " + violation);
    }
    auto locator = std::make_shared<toolgate::resilience::ServiceLocator>();
    toolgate::runtime::BackgroundJobsOptions job_options;
    job_options.workers = options.background_workers;
    auto jobs = std::make_shared<toolgate::runtime::BackgroundJobs>(job_options);

    // 4. Skills and registry
    auto supervisor = std::make_shared<toolgate::skills::SkillSupervisor>();
    toolgate::registry::CatalogLoader loader = toolgate::registry::empty_catalog_loader();
    if (options.catalog_path.has_value()) {
        const auto catalog_path = options.catalog_path.value();
        loader = [catalog_path]() { return toolgate::skills::load_skill_catalog(catalog_path); };
    }
    auto registry = std::make_shared<toolgate::registry::ToolRegistry>(supervisor, loader);
    const auto loaded = registry->reload();
    if (toolgate::core::errors::is_error(loaded)) {
        const auto& err = toolgate::core::errors::get_error(loaded);
        LOG_ERROR("Skill catalog not loaded [" + err.code + "]: " + err.message);
    }

    // 5. Collaborators
    std::shared_ptr<toolgate::collaborators::JsonlMemoryStore> memory;
    if (options.memory_file.has_value()) {
        memory = std::make_shared<toolgate::collaborators::JsonlMemoryStore>(
            options.memory_file.value());
        const auto opened = memory->open();
        if (toolgate::core::errors::is_error(opened)) {
            const auto& err = toolgate::core::errors::get_error(opened);
            LOG_ERROR("Memory store unavailable [" + err.code + "]: " + err.message);
        }
        locator->register_service(memory);
    } else {
        LOG_INFO("Gateway: no memory file, memory tools will report not_ready");
    }

    std::shared_ptr<toolgate::collaborators::SkillConsultant> consultant;
    if (options.consultant_skill.has_value()) {
        consultant = std::make_shared<toolgate::collaborators::SkillConsultant>(
            supervisor, options.consultant_skill.value(), timeouts);
        locator->register_service(consultant);
    }

    // 6. Handlers, router, dispatcher
    auto handlers = std::make_shared<toolgate::handlers::InternalHandlers>(locator, jobs, timeouts,
                                                                           registry);
    auto skill_client = std::make_shared<toolgate::skills::SkillClient>(timeouts);
    auto router = std::make_shared<toolgate::registry::Router>(registry, handlers, skill_client);
    toolgate::server::Dispatcher dispatcher(registry, router, timeouts);

    // 7. Serve until the client closes stdin
    LOG_INFO("Gateway: serving " + std::to_string(registry->list_all().size()) + " tools on stdio");
    toolgate::server::ProtocolLoop loop(std::cin, std::cout, dispatcher);
    const auto exit_reason = loop.run();
    const int exit_code = exit_reason == toolgate::server::LoopExit::EndOfStream ? 0 : 1;

    // 8. Calls abandoned on timeout may still be running; give them a
    // bounded grace period before static teardown.
    constexpr auto kShutdownGrace = std::chrono::milliseconds(2000);
    auto& workers = toolgate::resilience::WorkerTracker::get();
    if (!workers.wait_idle(kShutdownGrace)) {
        LOG_WARN("Gateway: " + std::to_string(workers.running()) +
                 " abandoned call(s) still running, exiting without teardown");
        jobs->shutdown();
        std::cout.flush();
        std::cerr.flush();
        std::quick_exit(exit_code);
    }

    jobs->shutdown();
    supervisor->shutdown_all();
    LOG_INFO("Gateway: background jobs completed=" + std::to_string(jobs->completed()) +
             " failed=" + std::to_string(jobs->failed()) +
             " rejected=" + std::to_string(jobs->rejected()));

    return exit_code;
}

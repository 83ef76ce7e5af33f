#include "handlers/internal_handlers.hpp"

#include <utility>
#include <variant>
#include <vector>
#include "collaborators/consultant.hpp"
#include "collaborators/memory_store.hpp"
#include "core/logging/logger.hpp"
#include "resilience/defensive.hpp"

namespace toolgate::handlers {

using collaborators::Consultant;
using collaborators::Memory;
using collaborators::MemoryStore;
using core::config::TimeoutClass;
using core::errors::ErrorCategory;
using core::errors::GatewayError;
using nlohmann::json;

namespace {

bool has_string(const json& arguments, const char* key) {
    return arguments.is_object() && arguments.contains(key) && arguments[key].is_string();
}

GatewayError missing_parameter(const std::string& message) {
    return GatewayError{ErrorCategory::Input, message, "missing_parameter"};
}

}  // namespace

std::string utf8_prefix(const std::string& text, const std::size_t max_chars) {
    std::size_t chars = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto byte = static_cast<unsigned char>(text[i]);
        const bool continuation = (byte & 0xC0) == 0x80;
        if (!continuation) {
            if (chars == max_chars) {
                return text.substr(0, i);
            }
            ++chars;
        }
    }
    return text;
}

InternalHandlers::InternalHandlers(std::shared_ptr<resilience::ServiceLocator> locator,
                                   std::shared_ptr<runtime::BackgroundJobs> jobs,
                                   std::shared_ptr<core::config::TimeoutHierarchy> timeouts,
                                   std::shared_ptr<registry::ToolRegistry> registry)
    : locator_(std::move(locator)),
      jobs_(std::move(jobs)),
      timeouts_(std::move(timeouts)),
      registry_(std::move(registry)) {}

core::errors::Result<json> InternalHandlers::ask(const json& arguments,
                                                 const core::config::CallBudget& budget) const {
    if (!has_string(arguments, "query")) {
        return missing_parameter("Missing required parameter: query");
    }
    const std::string query = arguments["query"].get<std::string>();

    const auto query_budget = timeouts_->nested(budget, TimeoutClass::Query);
    const auto per_call = timeouts_->nested(query_budget, TimeoutClass::PerCall);
    const auto database = timeouts_->nested(query_budget, TimeoutClass::Database);
    const auto llm = timeouts_->nested(query_budget, TimeoutClass::Llm);

    // 1. Related memories; any failure degrades to none.
    auto locator = locator_;
    const auto search_timeout = database.timeout;
    auto memories_outcome = resilience::with_fallback(
        [locator, query, search_timeout]() -> core::errors::Result<std::vector<Memory>> {
            auto outcome = resilience::safe_call<MemoryStore>(
                *locator, collaborators::kMemoryServiceName,
                [query](MemoryStore& memory) { return memory.search(query, kConsultMemoryLimit); },
                search_timeout);
            if (resilience::is_ok(outcome)) {
                return resilience::take_ok(std::move(outcome));
            }
            return GatewayError{ErrorCategory::Collaborator,
                                "memory search " + resilience::describe(outcome),
                                "memory_unavailable"};
        },
        []() { return std::vector<Memory>{}; },
        resilience::FallbackOptions{per_call.timeout, "memory search"});

    std::vector<Memory> memories;
    if (resilience::is_ok(memories_outcome)) {
        memories = resilience::take_ok(std::move(memories_outcome));
    }

    // 2. Consultation.
    auto consult_outcome = resilience::safe_call<Consultant>(
        *locator_, collaborators::kConsultantServiceName,
        [query, memories, llm](Consultant& consultant, const resilience::CancelToken& token) {
            return consultant.consult(query, memories, llm, token);
        },
        llm.timeout);

    std::string reason;
    std::string answer;
    if (resilience::is_ok(consult_outcome)) {
        auto result = resilience::take_ok(std::move(consult_outcome));
        if (core::errors::is_error(result)) {
            reason = core::errors::get_error(result).message;
        } else {
            answer = core::errors::get_value(result);
        }
    } else {
        reason = resilience::describe(consult_outcome);
    }
    if (!reason.empty()) {
        LOG_WARN("ask: consultation failed: " + reason);
        return GatewayError{ErrorCategory::Collaborator, "Brain consultation failed: " + reason,
                            "consultation_failed"};
    }

    // 3. Best-effort record of the consultation.
    const std::string summary =
        "Consultation: " + query + " => " + utf8_prefix(answer, kSummaryAnswerChars) + "...";
    const auto persisted = resilience::safe_cast<MemoryStore>(
        *locator_, collaborators::kMemoryServiceName,
        [summary](MemoryStore& memory) {
            return memory.store(summary, "observation", kConsultationImportance);
        },
        *jobs_);
    if (!resilience::is_ok(persisted)) {
        LOG_DEBUG("ask: consultation not recorded: " + resilience::describe(persisted));
    }

    json response;
    response["answer"] = answer;
    response["memories_consulted"] = memories.size();
    return response;
}

core::errors::Result<json> InternalHandlers::store(const json& arguments,
                                                   const core::config::CallBudget& budget) const {
    if (!has_string(arguments, "content") || !has_string(arguments, "category")) {
        return missing_parameter("Missing required parameters: content, category");
    }
    const std::string content = arguments["content"].get<std::string>();
    const std::string category = arguments["category"].get<std::string>();

    double importance = 0.5;
    if (arguments.contains("importance") && !arguments["importance"].is_null()) {
        const json& value = arguments["importance"];
        if (!value.is_number()) {
            return GatewayError{ErrorCategory::Input, "Importance must be a number.",
                                "invalid_importance"};
        }
        importance = value.get<double>();
        if (importance < 0.0 || importance > 1.0) {
            return GatewayError{ErrorCategory::Input, "Importance must be between 0 and 1.",
                                "invalid_importance"};
        }
    }

    const auto database = timeouts_->nested(budget, TimeoutClass::Database);
    auto outcome = resilience::safe_call<MemoryStore>(
        *locator_, collaborators::kMemoryServiceName,
        [content, category, importance](MemoryStore& memory) {
            return memory.store(content, category, importance);
        },
        database.timeout);

    if (!resilience::is_ok(outcome)) {
        return GatewayError{ErrorCategory::Collaborator,
                            "Failed to store: " + resilience::describe(outcome),
                            "store_failed"};
    }
    const auto result = resilience::take_ok(std::move(outcome));
    if (core::errors::is_error(result)) {
        return GatewayError{ErrorCategory::Collaborator,
                            "Failed to store: " + core::errors::get_error(result).message,
                            "store_failed"};
    }

    json response;
    response["stored"] = true;
    response["id"] = core::errors::get_value(result);
    return response;
}

core::errors::Result<json> InternalHandlers::reload() const {
    const auto status = registry_->reload();
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }

    json response;
    response["status"] = "success";
    response["message"] = "Skills reloaded";
    response["tools"] = registry_->snapshot()->tools.size();
    return response;
}

}  // namespace toolgate::handlers

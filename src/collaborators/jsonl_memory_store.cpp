#include "collaborators/jsonl_memory_store.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <set>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"

namespace toolgate::collaborators {

using core::errors::ErrorCategory;
using core::errors::GatewayError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

std::set<std::string> tokenize(const std::string& text) {
    std::set<std::string> tokens;
    std::string token;
    for (const char c : text) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) != 0 || uc >= 0x80) {
            token.push_back(static_cast<char>(std::tolower(uc)));
            continue;
        }
        if (!token.empty()) {
            tokens.insert(token);
            token.clear();
        }
    }
    if (!token.empty()) {
        tokens.insert(token);
    }
    return tokens;
}

}  // namespace

JsonlMemoryStore::JsonlMemoryStore(std::filesystem::path path)
    : MemoryStore(kMemoryServiceName), path_(std::move(path)) {}

core::errors::Status JsonlMemoryStore::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    set_readiness(resilience::Readiness::Initializing);

    std::error_code ec;
    const auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            set_readiness(resilience::Readiness::Crashed);
            return GatewayError{ErrorCategory::Collaborator,
                                "Unable to create memory directory: " + parent.string(),
                                "memory_dir_create_failed"};
        }
    }

    std::ofstream out(path_, std::ios::app);
    if (!out.is_open()) {
        set_readiness(resilience::Readiness::Crashed);
        return GatewayError{ErrorCategory::Collaborator,
                            "Unable to open memory file: " + path_.string(),
                            "memory_open_failed"};
    }

    set_readiness(resilience::Readiness::Ready);
    LOG_INFO("JsonlMemoryStore: using " + path_.string());
    return core::errors::ok_status();
}

core::errors::Result<std::string> JsonlMemoryStore::store(const std::string& content,
                                                          const std::string& category,
                                                          const double importance) {
    if (content.empty()) {
        return GatewayError{ErrorCategory::Input, "Memory content cannot be empty.",
                            "empty_content"};
    }
    if (category.empty()) {
        return GatewayError{ErrorCategory::Input, "Memory category cannot be empty.",
                            "empty_category"};
    }
    if (importance < 0.0 || importance > 1.0) {
        return GatewayError{ErrorCategory::Input, "Importance must be between 0 and 1.",
                            "invalid_importance"};
    }

    const std::string id = core::config::generate_id("mem-");
    json record;
    record["id"] = id;
    record["content"] = content;
    record["category"] = category;
    record["importance"] = importance;
    record["ts_unix_ms"] = now_unix_ms();

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path_, std::ios::app);
    if (!out.is_open()) {
        return GatewayError{ErrorCategory::Collaborator,
                            "Unable to open memory file: " + path_.string(),
                            "memory_open_failed"};
    }

    out << record.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out.good()) {
        return GatewayError{ErrorCategory::Collaborator,
                            "Unable to write memory record: " + path_.string(),
                            "memory_write_failed"};
    }
    return id;
}

core::errors::Result<std::vector<Memory>> JsonlMemoryStore::search(const std::string& query,
                                                                   const std::size_t limit) {
    const auto query_tokens = tokenize(query);
    std::vector<Memory> matches;
    if (query_tokens.empty() || limit == 0) {
        return matches;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path_);
    if (!in.is_open()) {
        return GatewayError{ErrorCategory::Collaborator,
                            "Unable to open memory file: " + path_.string(),
                            "memory_open_failed"};
    }

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) {
            continue;
        }
        const json record = json::parse(line, nullptr, false);
        if (record.is_discarded() || !record.is_object() ||
            !record.contains("content") || !record["content"].is_string()) {
            LOG_DEBUG("JsonlMemoryStore: skipping unreadable record at line " +
                      std::to_string(line_no));
            continue;
        }

        Memory memory;
        memory.content = record["content"].get<std::string>();
        const auto content_tokens = tokenize(memory.content);
        std::size_t hits = 0;
        for (const auto& token : query_tokens) {
            if (content_tokens.count(token) != 0) {
                ++hits;
            }
        }
        if (hits == 0) {
            continue;
        }

        memory.id = record.value("id", std::string());
        memory.category = record.value("category", std::string());
        memory.importance = record.value("importance", 0.5);
        memory.score = static_cast<double>(hits) / static_cast<double>(query_tokens.size());
        matches.push_back(std::move(memory));
    }

    std::stable_sort(matches.begin(), matches.end(), [](const Memory& a, const Memory& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.importance > b.importance;
    });
    if (matches.size() > limit) {
        matches.resize(limit);
    }
    return matches;
}

}  // namespace toolgate::collaborators

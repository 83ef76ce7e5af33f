#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include "collaborators/memory_store.hpp"

namespace toolgate::collaborators {

// Append-only store: one JSON object per line. Search ranks records by the
// share of query terms found in their content.
class JsonlMemoryStore : public MemoryStore {
public:
    explicit JsonlMemoryStore(std::filesystem::path path);

    core::errors::Status open();

    core::errors::Result<std::string> store(const std::string& content,
                                            const std::string& category,
                                            double importance) override;

    core::errors::Result<std::vector<Memory>> search(const std::string& query,
                                                     std::size_t limit) override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

}  // namespace toolgate::collaborators

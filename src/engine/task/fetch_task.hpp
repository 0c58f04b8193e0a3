#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "../../core/types/errors.hpp"

namespace Harvester {
namespace Engine {

enum class Purpose { Scrape, Suggest };

// pending -> in_flight -> { succeeded | retrying(n) | failed }
enum class TaskState { Pending, InFlight, Succeeded, Retrying, Failed };

inline const char* to_string(Purpose purpose) {
    return purpose == Purpose::Scrape ? "scrape" : "suggest";
}

inline const char* to_string(TaskState state) {
    switch (state) {
        case TaskState::Pending: return "pending";
        case TaskState::InFlight: return "in_flight";
        case TaskState::Succeeded: return "succeeded";
        case TaskState::Retrying: return "retrying";
        case TaskState::Failed: return "failed";
    }
    return "unknown";
}

struct FetchTask {
    std::string                target;
    Purpose                    purpose = Purpose::Scrape;
    int                        page    = 1;
    int                        depth   = 0;
    std::optional<std::string> parent;

    // Rewritten on every retry.
    int                        retry_count = 0;
    std::optional<std::string> proxy;

    uint64_t                              sequence         = 0;
    TaskState                             state            = TaskState::Pending;
    bool                                  block_retry_used = false;
    Core::ErrorKind                       last_error       = Core::ErrorKind::None;
    std::chrono::steady_clock::time_point not_before{};

    static FetchTask scrape(const std::string& keyword, int page = 1) {
        FetchTask task;
        task.target  = keyword;
        task.purpose = Purpose::Scrape;
        task.page    = page;
        return task;
    }

    static FetchTask suggest(const std::string&                prefix,
                             int                               depth  = 0,
                             const std::optional<std::string>& parent = std::nullopt) {
        FetchTask task;
        task.target  = prefix;
        task.purpose = Purpose::Suggest;
        task.depth   = depth;
        task.parent  = parent;
        return task;
    }

    // 1-based number of the fetch attempt this task is on.
    int attempt() const {
        return retry_count + (block_retry_used ? 1 : 0) + 1;
    }

    std::string describe() const {
        std::string out = std::string(to_string(purpose)) + " '" + target + "'";
        if (purpose == Purpose::Scrape)
            out += " (page " + std::to_string(page) + ")";
        return out;
    }
};

}  // namespace Engine
}  // namespace Harvester

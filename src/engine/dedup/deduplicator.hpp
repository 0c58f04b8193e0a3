#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>

#include "../task/fetch_task.hpp"

namespace Harvester {
namespace Engine {

// Lower-cases and collapses whitespace. This is the dedup unit, not raw text.
std::string normalize_keyword(const std::string& text);

struct VisitedKey {
    std::string text;
    Purpose     purpose = Purpose::Suggest;
    int         page    = 1;

    static VisitedKey of(const std::string& text, Purpose purpose, int page = 1);
    static VisitedKey of(const FetchTask& task);

    bool operator==(const VisitedKey& other) const {
        return purpose == other.purpose && page == other.page && text == other.text;
    }
};

struct VisitedKeyHash {
    size_t operator()(const VisitedKey& key) const {
        size_t h = std::hash<std::string>{}(key.text);
        h ^= std::hash<int>{}(static_cast<int>(key.purpose)) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<int>{}(key.page) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

class Deduplicator {
public:
    // Atomically checks and marks; true only for the first caller.
    bool try_visit(const VisitedKey& key);
    bool contains(const VisitedKey& key) const;

    size_t size() const;
    void   clear();

private:
    mutable std::mutex                             mutex_;
    std::unordered_set<VisitedKey, VisitedKeyHash> visited_;
};

}  // namespace Engine
}  // namespace Harvester

#include "deduplicator.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Harvester {
namespace Engine {

using namespace Harvester::Utils::Text;

std::string normalize_keyword(const std::string& text) {
    return collapse_whitespace(to_lower(text));
}

VisitedKey VisitedKey::of(const std::string& text, Purpose purpose, int page) {
    VisitedKey key;
    key.text    = normalize_keyword(text);
    key.purpose = purpose;
    key.page    = purpose == Purpose::Scrape ? page : 1;
    return key;
}

VisitedKey VisitedKey::of(const FetchTask& task) {
    return of(task.target, task.purpose, task.page);
}

bool Deduplicator::try_visit(const VisitedKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return visited_.insert(key).second;
}

bool Deduplicator::contains(const VisitedKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return visited_.count(key) > 0;
}

size_t Deduplicator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return visited_.size();
}

void Deduplicator::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    visited_.clear();
}

}  // namespace Engine
}  // namespace Harvester

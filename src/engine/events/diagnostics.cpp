#include "diagnostics.hpp"
#include "../../core/logger/logger.hpp"

namespace Harvester {
namespace Engine {

using namespace Harvester::Core;

const char* to_string(EventKind kind) {
    switch (kind) {
        case EventKind::TaskStarted: return "task_started";
        case EventKind::TaskSucceeded: return "task_succeeded";
        case EventKind::TaskRetrying: return "task_retrying";
        case EventKind::TaskFailed: return "task_failed";
        case EventKind::ProxyQuarantined: return "proxy_quarantined";
    }
    return "unknown";
}

EngineEvent EngineEvent::for_task(EventKind kind, const FetchTask& task) {
    EngineEvent event;
    event.kind       = kind;
    event.target     = task.target;
    event.purpose    = task.purpose;
    event.page       = task.page;
    event.depth      = task.depth;
    event.attempt    = task.attempt();
    event.error_kind = task.last_error;
    event.proxy      = task.proxy.value_or("direct");
    return event;
}

void Diagnostics::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void Diagnostics::emit(const EngineEvent& event) const {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners)
        listener(event);
}

bool Diagnostics::has_listeners() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !listeners_.empty();
}

void log_event(const EngineEvent& event) {
    std::string subject = std::string(to_string(event.purpose)) + " '" + event.target + "'";
    if (event.purpose == Purpose::Scrape)
        subject += " (page " + std::to_string(event.page) + ")";

    switch (event.kind) {
        case EventKind::TaskStarted: {
            std::string line = "Fetching: " + subject;
            if (event.attempt > 1)
                line += " [Retry " + std::to_string(event.attempt - 1) + "]";
            Logger::debug(line + " [" + event.proxy + "]");
            break;
        }
        case EventKind::TaskSucceeded:
            Logger::info("Done: " + subject + (event.message.empty() ? "" : " - " + event.message));
            break;
        case EventKind::TaskRetrying:
            Logger::warn("Retrying " + subject + " after " + to_string(event.error_kind)
                         + " error: " + event.message);
            break;
        case EventKind::TaskFailed:
            Logger::error("Giving up on " + subject + " (" + to_string(event.error_kind)
                          + "): " + event.message);
            break;
        case EventKind::ProxyQuarantined:
            Logger::warn("Quarantined proxy " + event.proxy + " while fetching " + subject);
            break;
    }
}

}  // namespace Engine
}  // namespace Harvester

#pragma once
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "../../core/types/errors.hpp"
#include "../task/fetch_task.hpp"

namespace Harvester {
namespace Engine {

enum class EventKind { TaskStarted, TaskSucceeded, TaskRetrying, TaskFailed, ProxyQuarantined };

const char* to_string(EventKind kind);

struct EngineEvent {
    EventKind       kind = EventKind::TaskStarted;
    std::string     target;
    Purpose         purpose    = Purpose::Scrape;
    int             page       = 1;
    int             depth      = 0;
    int             attempt    = 0;
    Core::ErrorKind error_kind = Core::ErrorKind::None;
    std::string     proxy;
    std::string     message;

    static EngineEvent for_task(EventKind kind, const FetchTask& task);
};

/**
 * @brief Fan-out of engine events to whoever subscribed.
 *
 * Listeners run synchronously on the emitting worker and must not call back
 * into the scheduler. With no listeners emit() does nothing.
 */
class Diagnostics {
public:
    using Listener = std::function<void(const EngineEvent&)>;

    void subscribe(Listener listener);
    void emit(const EngineEvent& event) const;
    bool has_listeners() const;

private:
    mutable std::mutex    mutex_;
    std::vector<Listener> listeners_;
};

// Renders events through the project logger.
void log_event(const EngineEvent& event);

}  // namespace Engine
}  // namespace Harvester

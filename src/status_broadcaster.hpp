#pragma once
#include "agent_types.hpp"
#include "event_log.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace deskmcp {

struct StatusChange {
    std::string instance_id;
    std::string logical_name;
    std::optional<AgentStatus> from;   // nullopt on first sighting
    AgentStatus to = AgentStatus::Online;
    double timestamp = 0.0;

    nlohmann::json to_json() const;
};

using StatusListener = std::function<void(const StatusChange&)>;

// Remembers the last status announced per instance and notifies listeners
// once per transition, however often the same status is observed.
class StatusBroadcaster {
public:
    explicit StatusBroadcaster(EventSink* events = nullptr) : events_(events) {}

    int subscribe(StatusListener listener);
    void unsubscribe(int id);

    // Returns true when `status` differs from the last broadcast and a
    // notification went out.
    bool observe(const std::string& instance_id, const std::string& logical_name,
                 AgentStatus status, double ts);

    // Drops cache entries for instances no longer registered.
    void retain(const std::set<std::string>& instance_ids);

    std::optional<AgentStatus> last_broadcast(const std::string& instance_id) const;

private:
    EventSink* events_;
    mutable std::mutex mutex_;
    std::map<std::string, AgentStatus> cache_;
    std::map<int, StatusListener> listeners_;
    int next_id_ = 1;
};

} // namespace deskmcp

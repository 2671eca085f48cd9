#include "status_broadcaster.hpp"
#include <iostream>
#include <vector>

namespace deskmcp {

nlohmann::json StatusChange::to_json() const {
    return {
        {"instance_id", instance_id},
        {"agent", logical_name},
        {"from", from ? status_to_string(*from) : "unknown"},
        {"to", status_to_string(to)},
        {"timestamp", timestamp}
    };
}

int StatusBroadcaster::subscribe(StatusListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    int id = next_id_++;
    listeners_[id] = std::move(listener);
    return id;
}

void StatusBroadcaster::unsubscribe(int id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(id);
}

bool StatusBroadcaster::observe(const std::string& instance_id, const std::string& logical_name,
                                AgentStatus status, double ts) {
    StatusChange change;
    std::vector<StatusListener> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(instance_id);
        if (it != cache_.end()) {
            if (it->second == status) return false;
            change.from = it->second;
        }
        cache_[instance_id] = status;
        for (auto& [_, l] : listeners_) targets.push_back(l);
    }

    change.instance_id = instance_id;
    change.logical_name = logical_name;
    change.to = status;
    change.timestamp = ts;

    std::cerr << "[liveness] " << instance_id << ": "
              << (change.from ? status_to_string(*change.from) : "unknown") << " -> "
              << status_to_string(status) << "\n";

    // listeners run outside the lock so they may call back into the server
    for (auto& l : targets) {
        try {
            l(change);
        } catch (const std::exception& e) {
            std::cerr << "[liveness] Status listener failed: " << e.what() << "\n";
        }
    }
    if (events_) {
        try {
            events_->emit("broadcast", change.to_json());
        } catch (const std::exception& e) {
            std::cerr << "[liveness] Event sink error: " << e.what() << "\n";
        }
    }
    return true;
}

void StatusBroadcaster::retain(const std::set<std::string>& instance_ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (instance_ids.count(it->first)) ++it;
        else it = cache_.erase(it);
    }
}

std::optional<AgentStatus> StatusBroadcaster::last_broadcast(const std::string& instance_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(instance_id);
    if (it == cache_.end()) return std::nullopt;
    return it->second;
}

} // namespace deskmcp

#include "heartbeat.hpp"
#include <chrono>
#include <iostream>
#include <set>

namespace deskmcp {

AgentStatus HeartbeatMonitor::compute_status(double elapsed_s, AgentStatus current, const LivenessConfig& cfg) {
    if (elapsed_s >= cfg.offline_after_s) return AgentStatus::Offline;
    if (current == AgentStatus::Offline || current == AgentStatus::Error) return current;
    if (elapsed_s >= cfg.busy_after_s) return AgentStatus::Busy;
    return AgentStatus::Online;
}

void HeartbeatMonitor::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread([this]() { run_loop(); });
}

void HeartbeatMonitor::stop() {
    if (!running_.exchange(false)) return;
    { std::lock_guard<std::mutex> lock(wait_mutex_); }
    wake_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void HeartbeatMonitor::run_loop() {
    std::cerr << "[liveness] Started (interval=" << cfg_.tick_interval_ms << "ms, busy="
              << cfg_.busy_after_s << "s, offline=" << cfg_.offline_after_s << "s)\n";
    while (running_) {
        try {
            tick();
        } catch (const std::exception& e) {
            std::cerr << "[liveness] Sweep error: " << e.what() << "\n";
        }

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wake_.wait_for(lock, std::chrono::milliseconds(cfg_.tick_interval_ms),
                       [this]() { return !running_; });
    }
    std::cerr << "[liveness] Stopped\n";
}

void HeartbeatMonitor::ping(const AgentRegistration& reg) {
    RpcReply reply = transport_.call(reg.address, "Ping", nlohmann::json::object(),
                                     std::chrono::milliseconds(cfg_.ping_timeout_ms));
    if (!reply.ok()) return;

    registry_.touch(reg.instance_id, clock_());
    if (reply.body.is_object() && reply.body.contains("cpu_usage") && reply.body["cpu_usage"].is_number()) {
        registry_.set_cpu_usage(reg.instance_id, reply.body["cpu_usage"].get<double>());
    }
}

int HeartbeatMonitor::tick() {
    int notifications = 0;

    for (auto& reg : registry_.list_all()) {
        try {
            if (cfg_.ping_agents) ping(reg);

            double now = clock_();
            // decided against the entry as it is now, not the listed copy
            auto current = registry_.recompute_status(reg.instance_id, [&](const AgentRegistration& r) {
                return compute_status(now - r.last_seen, r.status, cfg_);
            });
            if (!current) continue;

            if (broadcaster_.observe(current->instance_id, current->logical_name, current->status, now)) {
                notifications++;
            }
        } catch (const std::exception& e) {
            std::cerr << "[liveness] Check of " << reg.instance_id << " failed: " << e.what() << "\n";
        }
    }

    // re-list so instances registered during the sweep keep their cache entry
    std::set<std::string> present;
    for (auto& reg : registry_.list_all()) present.insert(reg.instance_id);
    broadcaster_.retain(present);
    return notifications;
}

} // namespace deskmcp

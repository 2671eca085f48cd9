#pragma once
#include "agent_registry.hpp"
#include "config.hpp"
#include "status_broadcaster.hpp"
#include "rpc/transport.hpp"
#include "utils.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace deskmcp {

// Single background loop that keeps registry status honest: every tick it
// pings each instance (time-bounded), lets status decay with time since
// last_seen, and broadcasts transitions.
class HeartbeatMonitor {
public:
    HeartbeatMonitor(AgentRegistry& registry, RpcTransport& transport,
                     StatusBroadcaster& broadcaster, LivenessConfig cfg,
                     Clock clock = system_clock())
        : registry_(registry)
        , transport_(transport)
        , broadcaster_(broadcaster)
        , cfg_(cfg)
        , clock_(std::move(clock))
    {}

    ~HeartbeatMonitor() { stop(); }

    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

    void start();
    void stop();
    bool running() const { return running_; }

    // One sweep over every registered instance. Returns the number of status
    // notifications sent.
    int tick();

    // offline beats error beats the time-derived online/busy. Offline is only
    // left through touch() (registration, call or ping).
    static AgentStatus compute_status(double elapsed_s, AgentStatus current, const LivenessConfig& cfg);

private:
    AgentRegistry& registry_;
    RpcTransport& transport_;
    StatusBroadcaster& broadcaster_;
    LivenessConfig cfg_;
    Clock clock_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex wait_mutex_;
    std::condition_variable wake_;

    void run_loop();
    void ping(const AgentRegistration& reg);
};

} // namespace deskmcp

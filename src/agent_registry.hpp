#pragma once
#include "agent_types.hpp"
#include <string>
#include <vector>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

struct sqlite3;

namespace deskmcp {

// Bookkeeping of every known agent instance, keyed by instance_id.
//
// The in-memory map is authoritative for reads; every mutation is written
// through to SQLite first so a failed write leaves the map untouched. One
// coarse mutex guards both, and readers always receive copies.
class AgentRegistry {
public:
    // db_path may be ":memory:" or empty for a volatile registry.
    explicit AgentRegistry(const std::string& db_path);
    ~AgentRegistry();

    AgentRegistry(const AgentRegistry&) = delete;
    AgentRegistry& operator=(const AgentRegistry&) = delete;

    void upsert(const AgentRegistration& reg);
    // Inserts reg and drops every other instance at the same service+path in
    // one transaction. Returns the ids that were replaced.
    std::vector<std::string> replace_at_address(const AgentRegistration& reg);
    // Returns whether an entry was removed; absent ids are not an error.
    bool remove(const std::string& instance_id);

    std::vector<AgentRegistration> list_all() const;
    std::vector<AgentRegistration> get_by_logical_name(const std::string& name) const;
    std::optional<AgentRegistration> get(const std::string& instance_id) const;
    std::optional<AgentRegistration> find_by_address(const AgentAddress& address) const;
    bool contains(const std::string& instance_id) const;
    size_t size() const;

    // Records activity. Offline/busy instances come back online; an explicit
    // error status is left for the agent to clear.
    bool touch(const std::string& instance_id, double ts);
    bool set_status(const std::string& instance_id, AgentStatus status);
    bool set_cpu_usage(const std::string& instance_id, double load);

    // Applies rule to the current entry and stores its result, all under the
    // registry lock, so a touch cannot be overwritten by a stale status.
    using StatusRule = std::function<AgentStatus(const AgentRegistration&)>;
    std::optional<AgentRegistration> recompute_status(const std::string& instance_id, const StatusRule& rule);

private:
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
    std::map<std::string, AgentRegistration> entries_;

    void init_db();
    void load_all();
    void write_row(const AgentRegistration& reg);
    void delete_row(const std::string& instance_id);
    void write_state(const AgentRegistration& reg);
    void exec(const char* sql);
};

} // namespace deskmcp

#include "agent_registry.hpp"
#include "utils.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <iostream>

namespace deskmcp {

static std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* t = sqlite3_column_text(stmt, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static sqlite3_stmt* prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Registry prepare failed: " + std::string(sqlite3_errmsg(db)));
    }
    return stmt;
}

static void step_done(sqlite3* db, sqlite3_stmt* stmt, const char* what) {
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Registry ") + what + " failed: " + sqlite3_errmsg(db));
    }
}

AgentRegistry::AgentRegistry(const std::string& db_path) {
    std::string path = db_path.empty() ? ":memory:" : db_path;
    if (path != ":memory:") {
        auto parent = fs::path(path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
    }
    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open registry DB: " + msg);
    }
    try {
        init_db();
        load_all();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    if (!entries_.empty()) {
        std::cerr << "[registry] Restored " << entries_.size() << " instance(s) from " << path << "\n";
    }
}

AgentRegistry::~AgentRegistry() {
    if (db_) sqlite3_close(db_);
}

void AgentRegistry::init_db() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS agents (
            instance_id   TEXT PRIMARY KEY,
            logical_name  TEXT NOT NULL,
            service       TEXT NOT NULL,
            path          TEXT NOT NULL,
            interface     TEXT NOT NULL,
            tools         TEXT NOT NULL,
            status        TEXT NOT NULL,
            last_seen     REAL DEFAULT 0,
            cpu_usage     REAL DEFAULT -1,
            registered_at REAL DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS agents_logical_name ON agents(logical_name);
    )";
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("Failed to init registry DB: " + msg);
    }
}

void AgentRegistry::load_all() {
    const char* sql = "SELECT instance_id, logical_name, service, path, interface, tools, "
                      "status, last_seen, cpu_usage, registered_at FROM agents";
    sqlite3_stmt* stmt = prepare(db_, sql);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        AgentRegistration reg;
        reg.instance_id = column_text(stmt, 0);
        reg.logical_name = column_text(stmt, 1);
        reg.address.service = column_text(stmt, 2);
        reg.address.path = column_text(stmt, 3);
        reg.address.interface = column_text(stmt, 4);
        try {
            auto tools = nlohmann::json::parse(column_text(stmt, 5));
            for (auto& t : tools) reg.tools.push_back(ToolDescriptor::from_json(t));
        } catch (const std::exception& e) {
            std::cerr << "[registry] Dropping unreadable tool list of " << reg.instance_id
                      << ": " << e.what() << "\n";
        }
        reg.status = parse_status(column_text(stmt, 6)).value_or(AgentStatus::Offline);
        reg.last_seen = sqlite3_column_double(stmt, 7);
        reg.cpu_usage = sqlite3_column_double(stmt, 8);
        reg.registered_at = sqlite3_column_double(stmt, 9);
        entries_[reg.instance_id] = std::move(reg);
    }
    sqlite3_finalize(stmt);
}

void AgentRegistry::write_row(const AgentRegistration& reg) {
    const char* sql = "INSERT OR REPLACE INTO agents (instance_id, logical_name, service, path, "
                      "interface, tools, status, last_seen, cpu_usage, registered_at) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    std::string tools = reg.tools_json().dump();
    std::string status = status_to_string(reg.status);

    sqlite3_stmt* stmt = prepare(db_, sql);
    sqlite3_bind_text(stmt, 1, reg.instance_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, reg.logical_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, reg.address.service.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, reg.address.path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, reg.address.interface.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, tools.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 7, status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 8, reg.last_seen);
    sqlite3_bind_double(stmt, 9, reg.cpu_usage);
    sqlite3_bind_double(stmt, 10, reg.registered_at);
    step_done(db_, stmt, "upsert");
}

void AgentRegistry::delete_row(const std::string& instance_id) {
    sqlite3_stmt* stmt = prepare(db_, "DELETE FROM agents WHERE instance_id = ?");
    sqlite3_bind_text(stmt, 1, instance_id.c_str(), -1, SQLITE_TRANSIENT);
    step_done(db_, stmt, "delete");
}

void AgentRegistry::write_state(const AgentRegistration& reg) {
    const char* sql = "UPDATE agents SET status = ?, last_seen = ?, cpu_usage = ? WHERE instance_id = ?";
    std::string status = status_to_string(reg.status);
    sqlite3_stmt* stmt = prepare(db_, sql);
    sqlite3_bind_text(stmt, 1, status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 2, reg.last_seen);
    sqlite3_bind_double(stmt, 3, reg.cpu_usage);
    sqlite3_bind_text(stmt, 4, reg.instance_id.c_str(), -1, SQLITE_TRANSIENT);
    step_done(db_, stmt, "state update");
}

void AgentRegistry::upsert(const AgentRegistration& reg) {
    if (reg.instance_id.empty()) throw std::invalid_argument("Registration is missing instance_id");
    if (reg.logical_name.empty()) throw std::invalid_argument("Registration is missing logical_name");
    if (reg.address.service.empty()) throw std::invalid_argument("Registration is missing address");

    std::lock_guard<std::mutex> lock(mutex_);
    write_row(reg);
    entries_[reg.instance_id] = reg;
}

void AgentRegistry::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error(std::string("Registry '") + sql + "' failed: " + msg);
    }
}

std::vector<std::string> AgentRegistry::replace_at_address(const AgentRegistration& reg) {
    if (reg.instance_id.empty()) throw std::invalid_argument("Registration is missing instance_id");
    if (reg.logical_name.empty()) throw std::invalid_argument("Registration is missing logical_name");
    if (reg.address.service.empty()) throw std::invalid_argument("Registration is missing address");

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> replaced;
    for (auto& [id, existing] : entries_) {
        if (id != reg.instance_id && existing.address.same_endpoint(reg.address)) replaced.push_back(id);
    }

    exec("BEGIN");
    try {
        for (auto& id : replaced) delete_row(id);
        write_row(reg);
        exec("COMMIT");
    } catch (const std::exception&) {
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }

    for (auto& id : replaced) entries_.erase(id);
    entries_[reg.instance_id] = reg;
    return replaced;
}

bool AgentRegistry::remove(const std::string& instance_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(instance_id);
    if (it == entries_.end()) return false;
    delete_row(instance_id);
    entries_.erase(it);
    return true;
}

std::vector<AgentRegistration> AgentRegistry::list_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentRegistration> out;
    out.reserve(entries_.size());
    for (auto& [_, reg] : entries_) out.push_back(reg);
    return out;
}

std::vector<AgentRegistration> AgentRegistry::get_by_logical_name(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentRegistration> out;
    for (auto& [_, reg] : entries_) {
        if (reg.logical_name == name) out.push_back(reg);
    }
    return out;
}

std::optional<AgentRegistration> AgentRegistry::get(const std::string& instance_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(instance_id);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::optional<AgentRegistration> AgentRegistry::find_by_address(const AgentAddress& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [_, reg] : entries_) {
        if (reg.address.same_endpoint(address)) return reg;
    }
    return std::nullopt;
}

bool AgentRegistry::contains(const std::string& instance_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(instance_id) > 0;
}

size_t AgentRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool AgentRegistry::touch(const std::string& instance_id, double ts) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(instance_id);
    if (it == entries_.end()) return false;

    AgentRegistration updated = it->second;
    updated.last_seen = ts;
    if (updated.status != AgentStatus::Error) updated.status = AgentStatus::Online;
    write_state(updated);
    it->second = std::move(updated);
    return true;
}

bool AgentRegistry::set_status(const std::string& instance_id, AgentStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(instance_id);
    if (it == entries_.end()) return false;
    if (it->second.status == status) return true;

    AgentRegistration updated = it->second;
    updated.status = status;
    write_state(updated);
    it->second = std::move(updated);
    return true;
}

std::optional<AgentRegistration> AgentRegistry::recompute_status(const std::string& instance_id,
                                                                 const StatusRule& rule) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(instance_id);
    if (it == entries_.end()) return std::nullopt;

    AgentStatus next = rule(it->second);
    if (next != it->second.status) {
        AgentRegistration updated = it->second;
        updated.status = next;
        write_state(updated);
        it->second = std::move(updated);
    }
    return it->second;
}

bool AgentRegistry::set_cpu_usage(const std::string& instance_id, double load) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(instance_id);
    if (it == entries_.end()) return false;

    AgentRegistration updated = it->second;
    updated.cpu_usage = load;
    write_state(updated);
    it->second = std::move(updated);
    return true;
}

} // namespace deskmcp

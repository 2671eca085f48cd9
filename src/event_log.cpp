#include "event_log.hpp"
#include <fstream>
#include <iostream>

namespace deskmcp {

JsonlEventLog::JsonlEventLog(const std::string& dir) : dir_(dir) {
    fs::create_directories(dir_);
}

void JsonlEventLog::emit(const std::string& type, nlohmann::json event) {
    event["type"] = type;
    if (!event.contains("timestamp")) event["timestamp"] = epoch_seconds();

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream f(current_file(), std::ios::app);
    if (!f) {
        std::cerr << "[events] Cannot open " << current_file() << "\n";
        return;
    }
    f << event.dump() << "\n";
}

} // namespace deskmcp

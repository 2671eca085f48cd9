#pragma once
#include "utils.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>

namespace deskmcp {

// Receives schedule / execution / broadcast events for an external
// trajectory store. The server never reads them back.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const std::string& type, nlohmann::json event) = 0;
};

// Appends one JSON object per line to <dir>/<YYYY-MM-DD>.jsonl.
class JsonlEventLog : public EventSink {
public:
    explicit JsonlEventLog(const std::string& dir);

    void emit(const std::string& type, nlohmann::json event) override;
    std::string current_file() const {
        return dir_ + "/" + today_str() + ".jsonl";
    }

private:
    std::string dir_;
    std::mutex mutex_;
};

} // namespace deskmcp

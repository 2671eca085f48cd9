#pragma once
#include <string>
#include <cstdlib>
#include <cstdint>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <functional>

namespace deskmcp {

namespace fs = std::filesystem;

// Seconds since epoch with sub-second precision. Injected wherever liveness
// math happens so tests can move time by hand.
using Clock = std::function<double()>;

inline double epoch_seconds() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline Clock system_clock() {
    return [] { return epoch_seconds(); };
}

inline int64_t epoch_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline std::string home_dir() {
#ifdef _WIN32
    const char* h = std::getenv("USERPROFILE");
    if (!h) h = std::getenv("HOMEDRIVE");
#else
    const char* h = std::getenv("HOME");
#endif
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && (p[1] == '/' || p[1] == '\\')) {
        return home_dir() + p.substr(1);
    }
    return p;
}

inline std::string default_config_path() {
    return home_dir() + "/.deskmcp/config.json";
}

inline std::string today_str() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

struct UrlParts {
    std::string scheme = "http";
    std::string host = "127.0.0.1";
    int port = 80;
    std::string path;
};

// "http://host:port/prefix" -> parts. Missing port falls back to the scheme default.
inline UrlParts parse_url(const std::string& url) {
    UrlParts u;
    size_t pos = 0;
    if (url.rfind("https://", 0) == 0) {
        u.scheme = "https"; pos = 8; u.port = 443;
    } else if (url.rfind("http://", 0) == 0) {
        pos = 7;
    }

    size_t slash = url.find('/', pos);
    std::string host_port = (slash != std::string::npos) ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) {
        u.path = url.substr(slash);
        while (!u.path.empty() && u.path.back() == '/') u.path.pop_back();
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        u.host = host_port.substr(0, colon);
        u.port = std::stoi(host_port.substr(colon + 1));
    } else if (!host_port.empty()) {
        u.host = host_port;
    }
    return u;
}

} // namespace deskmcp

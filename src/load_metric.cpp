#include "load_metric.hpp"
#include <ctime>

#ifndef _WIN32
#include <sys/resource.h>
#endif

namespace deskmcp {

ProcessCpuSampler::ProcessCpuSampler()
    : last_cpu_s_(process_cpu_seconds())
    , last_wall_(std::chrono::steady_clock::now()) {}

double ProcessCpuSampler::process_cpu_seconds() {
#ifdef _WIN32
    return static_cast<double>(std::clock()) / CLOCKS_PER_SEC;
#else
    rusage ru{};
    if (getrusage(RUSAGE_SELF, &ru) != 0) return 0.0;
    auto tv = [](const timeval& t) { return t.tv_sec + t.tv_usec / 1e6; };
    return tv(ru.ru_utime) + tv(ru.ru_stime);
#endif
}

double ProcessCpuSampler::sample() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    double cpu = process_cpu_seconds();
    double wall = std::chrono::duration<double>(now - last_wall_).count();

    // too short an interval gives noise; keep the previous reading
    if (wall < 0.05) return last_value_;

    double pct = (cpu - last_cpu_s_) / wall * 100.0;
    if (pct < 0.0) pct = 0.0;
    last_cpu_s_ = cpu;
    last_wall_ = now;
    last_value_ = pct;
    return pct;
}

} // namespace deskmcp

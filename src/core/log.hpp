#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <mutex>
#include <core/types.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Debug log shared by every component: $SSHLITE_LOG, else <tmp>/sshlite_debug.log.
inline std::string sshlite_log_path() {
    static std::string path = [] {
        const char* env = std::getenv("SSHLITE_LOG");
        if (env && *env) return std::string(env);
        return (platform::temp_dir() / "sshlite_debug.log").string();
    }();
    return path;
}

inline void sshlite_log(const std::string& msg) {
    static std::mutex log_mutex;
    std::lock_guard<std::mutex> lock(log_mutex);
    std::ofstream out(sshlite_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}

inline void sshlite_log_ssh(const std::string& label, const std::string& cmd,
                            const SSHResult& r) {
    sshlite_log(fmt::format("{} CMD: {}", label, cmd));
    sshlite_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                            r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        sshlite_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}

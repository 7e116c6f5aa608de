#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>
#include <filesystem>
#include <platform/platform.hpp>

// Process-wide log state. Supervised process output is logged from reader
// threads, so every write goes through the same mutex.
struct LogState {
    std::mutex mutex;
    std::string path = (platform::temp_dir() / "stagehand.log").string();
};

inline LogState& log_state() {
    static LogState state;
    return state;
}

inline std::string stagehand_log_path() {
    std::lock_guard<std::mutex> lock(log_state().mutex);
    return log_state().path;
}

inline void set_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_state().mutex);
    log_state().path = path;
}

inline void stagehand_log_line(const char* level, const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(log_state().mutex);
    std::ofstream out(log_state().path, std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << level << msg << "\n";
}

inline void stagehand_log(const std::string& msg) {
    stagehand_log_line("", msg);
}

inline void stagehand_log_error(const std::string& msg) {
    stagehand_log_line("ERROR ", msg);
}

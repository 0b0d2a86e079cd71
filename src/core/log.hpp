#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <fmt/format.h>
#include <platform/platform.hpp>

inline std::string tplreg_log_path() {
    static std::string path = (platform::temp_dir() / "tplreg_debug.log").string();
    return path;
}

inline void tplreg_log(const std::string& msg) {
    std::ofstream out(tplreg_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    out << fmt::format("[{:02}:{:02}:{:02}.{:03}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}

#pragma once
#ifndef LRU_TIME_UTILS_H
#define LRU_TIME_UTILS_H

#include <chrono>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>

namespace lru {

/**
 * Cross platform safe localtime wrapper.
 * windows -> localtime_s
 * Linux/Unix -> localtime_r
 */
inline std::tm safe_localtime(std::time_t time){
    std::tm tm_buf{};
#if defined(_WIN32) || defined(_WIN64)
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif
    return tm_buf;
}

/**
 * @return current local time as "YYYY-MM-DD HH:MM:SS"
 */
inline std::string timestamp_now(){
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf = safe_localtime(now);
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%F %T");
    return ss.str();
}

/**
 * Write "[timestamp] message" as one line and flush.
 */
inline void log_line(std::ostream& out, const std::string& message){
    out << "[" << timestamp_now() << "] " << message << std::endl;
}

} // namespace lru

#endif // LRU_TIME_UTILS_H

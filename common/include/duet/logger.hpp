/**
 * @file logger.hpp
 * @brief 简单的日志宏定义
 *
 * 提供带时间戳和级别过滤的日志输出，确保在 systemd 环境下能正确显示
 */

#pragma once

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace duet {

enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR
};

/**
 * @brief 全局日志级别（低于该级别的日志被丢弃）
 */
inline std::atomic<int>& log_threshold() {
    static std::atomic<int> threshold{static_cast<int>(LogLevel::INFO)};
    return threshold;
}

inline void set_log_level(LogLevel level) {
    log_threshold() = static_cast<int>(level);
}

/**
 * @brief 解析 "DEBUG" / "INFO" / "WARN" / "ERROR"，无法识别时返回 INFO
 */
inline LogLevel parse_log_level(const std::string& name) {
    if (name == "DEBUG" || name == "debug") return LogLevel::DEBUG;
    if (name == "WARN" || name == "warn" || name == "WARNING") return LogLevel::WARN;
    if (name == "ERROR" || name == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= log_threshold().load();
}

/**
 * @brief 获取当前时间戳字符串
 * @return 格式: YYYY-MM-DD HH:MM:SS.mmm
 */
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&now_c), "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace duet

// 日志宏定义（自动刷新缓冲区，避免 systemd 日志丢失）
#define LOG_INFO(msg) \
    do { \
        if (duet::log_enabled(duet::LogLevel::INFO)) { \
            std::cout << "[" << duet::get_timestamp() << "] [INFO] " \
                      << msg << std::endl; \
        } \
    } while(0)

#define LOG_WARN(msg) \
    do { \
        if (duet::log_enabled(duet::LogLevel::WARN)) { \
            std::cout << "[" << duet::get_timestamp() << "] [WARN] " \
                      << msg << std::endl; \
        } \
    } while(0)

#define LOG_ERROR(msg) \
    do { \
        if (duet::log_enabled(duet::LogLevel::ERROR)) { \
            std::cerr << "[" << duet::get_timestamp() << "] [ERROR] " \
                      << msg << std::endl; \
        } \
    } while(0)

#define LOG_DEBUG(msg) \
    do { \
        if (duet::log_enabled(duet::LogLevel::DEBUG)) { \
            std::cout << "[" << duet::get_timestamp() << "] [DEBUG] " \
                      << msg << std::endl; \
        } \
    } while(0)

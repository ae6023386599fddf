/**
 * @file config.hpp
 * @brief 中继服务器配置
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace duet::relay {

/**
 * @brief 服务器配置
 */
struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8787;
    size_t max_connections = 64;
    size_t max_message_bytes = 64 * 1024;
};

/**
 * @brief 日志配置
 */
struct LoggingConfig {
    std::string level = "INFO";
};

/**
 * @brief 总配置
 */
class Config {
public:
    /**
     * @brief 从文件加载配置
     * @param path 配置文件路径
     * @return 是否成功（失败时保留默认值）
     */
    bool load_from_file(const std::string& path);

    /**
     * @brief 从环境变量覆盖配置
     */
    void load_from_env();

    ServerConfig server;
    LoggingConfig logging;
};

} // namespace duet::relay

/**
 * @file config.hpp
 * @brief 配置管理
 */

#pragma once

#include <string>
#include <vector>

namespace duet::peer {

struct IceServer {
    std::string urls;
    std::string username;
    std::string credential;
};

/**
 * @brief 中继（信令）配置
 */
struct RelayConfig {
    std::string url = "ws://127.0.0.1:8787/relay";
    std::string channel_prefix = "room-";
    int subscribe_timeout_ms = 10000;
    int disconnect_grace_ms = 1000;
};

/**
 * @brief 在场广播配置
 */
struct PresenceConfig {
    int interval_ms = 2000;
    int max_retries = 5;
};

/**
 * @brief 协商配置
 */
struct NegotiationConfig {
    int media_wait_ms = 3000;  // Leader 创建 Offer 前等待本地媒体的上限
};

/**
 * @brief 房间配置
 */
struct RoomConfig {
    int inactivity_timeout_sec = 15 * 60;  // 0 表示不启用
};

struct WebRtcConfig {
    std::vector<IceServer> ice_servers;
};

struct MediaConfig {
    bool audio = true;
    bool video = true;
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
    Config();

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

    RelayConfig relay;
    PresenceConfig presence;
    NegotiationConfig negotiation;
    RoomConfig room;
    WebRtcConfig webrtc;
    MediaConfig media;
    LoggingConfig logging;

private:
    /**
     * @brief 展开环境变量
     * @param value 可能包含 ${VAR} 的字符串
     * @return 展开后的字符串
     */
    static std::string expand_env(const std::string& value);
};

} // namespace duet::peer

/**
 * @file config.cpp
 * @brief 配置管理实现
 */

#include "peer_endpoint/config.hpp"

#include "duet/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

namespace duet::peer {

Config::Config() {
    // 默认仅使用公共 STUN 服务器
    for (const char* url : {"stun:stun.l.google.com:19302",
                            "stun:global.stun.twilio.com:3478",
                            "stun:stun1.l.google.com:19302",
                            "stun:stun2.l.google.com:19302"}) {
        IceServer s;
        s.urls = url;
        webrtc.ice_servers.push_back(s);
    }
}

bool Config::load_from_file(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        YAML::Node config = YAML::LoadFile(path);

        if (config["relay"]) {
            auto r = config["relay"];
            if (r["url"]) relay.url = expand_env(r["url"].as<std::string>());
            if (r["channel_prefix"]) relay.channel_prefix = r["channel_prefix"].as<std::string>();
            if (r["subscribe_timeout_ms"]) relay.subscribe_timeout_ms = r["subscribe_timeout_ms"].as<int>();
            if (r["disconnect_grace_ms"]) relay.disconnect_grace_ms = r["disconnect_grace_ms"].as<int>();
        }

        if (config["presence"]) {
            auto p = config["presence"];
            if (p["interval_ms"]) presence.interval_ms = p["interval_ms"].as<int>();
            if (p["max_retries"]) presence.max_retries = p["max_retries"].as<int>();
        }

        if (config["negotiation"]) {
            auto n = config["negotiation"];
            if (n["media_wait_ms"]) negotiation.media_wait_ms = n["media_wait_ms"].as<int>();
        }

        if (config["room"]) {
            auto rm = config["room"];
            if (rm["inactivity_timeout_sec"]) {
                room.inactivity_timeout_sec = rm["inactivity_timeout_sec"].as<int>();
            }
        }

        // 配置文件中给出 ice_servers 时整体替换默认列表
        if (config["webrtc"] && config["webrtc"]["ice_servers"]) {
            webrtc.ice_servers.clear();
            for (const auto& node : config["webrtc"]["ice_servers"]) {
                IceServer s;
                s.urls = node["urls"].as<std::string>("");
                s.username = expand_env(node["username"].as<std::string>(""));
                s.credential = expand_env(node["credential"].as<std::string>(""));
                if (!s.urls.empty()) {
                    webrtc.ice_servers.push_back(s);
                }
            }
        }

        if (config["media"]) {
            auto m = config["media"];
            if (m["audio"]) media.audio = m["audio"].as<bool>();
            if (m["video"]) media.video = m["video"].as<bool>();
        }

        if (config["logging"]) {
            auto l = config["logging"];
            if (l["level"]) logging.level = l["level"].as<std::string>();
        }

        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error: " << e.what());
        return false;
    }
}

void Config::load_from_env() {
    if (const char* val = std::getenv("DUET_RELAY_URL")) {
        relay.url = val;
    }

    if (const char* val = std::getenv("DUET_LOG_LEVEL")) {
        logging.level = val;
    }

    // 逗号分隔，例如 "stun:a:3478,stun:b:19302"
    if (const char* val = std::getenv("DUET_ICE_SERVERS")) {
        std::vector<IceServer> servers;
        std::stringstream ss(val);
        std::string url;
        while (std::getline(ss, url, ',')) {
            if (url.empty()) continue;
            IceServer s;
            s.urls = url;
            servers.push_back(s);
        }
        if (!servers.empty()) {
            webrtc.ice_servers = std::move(servers);
        }
    }
}

std::string Config::expand_env(const std::string& value) {
    // 匹配 ${VAR} 或 $VAR
    std::regex env_regex(R"(\$\{([^}]+)\}|\$([A-Za-z_][A-Za-z0-9_]*))");

    std::string result = value;
    std::smatch match;

    while (std::regex_search(result, match, env_regex)) {
        std::string var_name = match[1].matched ? match[1].str() : match[2].str();
        std::string replacement;

        if (const char* val = std::getenv(var_name.c_str())) {
            replacement = val;
        }

        result = result.substr(0, match.position()) +
                 replacement +
                 result.substr(match.position() + match.length());
    }

    return result;
}

} // namespace duet::peer

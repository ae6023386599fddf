/**
 * @file config.cpp
 * @brief 中继服务器配置实现
 */

#include "relay_server/config.hpp"

#include "duet/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>

namespace duet::relay {

bool Config::load_from_file(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        YAML::Node config = YAML::LoadFile(path);

        if (config["server"]) {
            auto s = config["server"];
            if (s["host"]) server.host = s["host"].as<std::string>();
            if (s["port"]) server.port = s["port"].as<uint16_t>();
            if (s["max_connections"]) server.max_connections = s["max_connections"].as<size_t>();
            if (s["max_message_bytes"]) server.max_message_bytes = s["max_message_bytes"].as<size_t>();
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
    if (const char* val = std::getenv("DUET_RELAY_HOST")) {
        server.host = val;
    }

    if (const char* val = std::getenv("DUET_RELAY_PORT")) {
        try {
            server.port = static_cast<uint16_t>(std::stoi(val));
        } catch (const std::exception&) {
            LOG_WARN("Ignoring invalid DUET_RELAY_PORT: " << val);
        }
    }

    if (const char* val = std::getenv("DUET_LOG_LEVEL")) {
        logging.level = val;
    }
}

} // namespace duet::relay

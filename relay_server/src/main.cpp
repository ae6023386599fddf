/**
 * @file main.cpp
 * @brief Relay Server 主程序入口
 */

#include "relay_server/config.hpp"
#include "relay_server/relay_server.hpp"

#include "duet/logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <algorithm>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace net = boost::asio;

int main(int argc, char* argv[]) {
    // 配置文件路径
    std::string config_path = "config/relay_server.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }

    // 加载配置
    duet::relay::Config config;
    if (!config.load_from_file(config_path)) {
        std::cerr << "Failed to load config from: " << config_path << std::endl;
        std::cerr << "Using default configuration" << std::endl;
    }
    config.load_from_env();
    duet::set_log_level(duet::parse_log_level(config.logging.level));

    std::cout << "=== Duet Relay Server ===" << std::endl;
    std::cout << "Config: " << config_path << std::endl;
    std::cout << "Listen: " << config.server.host << ":" << config.server.port << std::endl;

    try {
        net::io_context io_context;

        auto server = std::make_shared<duet::relay::RelayServer>(io_context, config);
        server->start();

        // 信号处理
        net::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int signal) {
            std::cout << "\nReceived signal " << signal << ", shutting down..." << std::endl;
            server->stop();
            io_context.stop();
        });

        // 运行 IO 上下文（多线程）
        const auto thread_count = std::max(1u, std::thread::hardware_concurrency());
        std::vector<std::thread> threads;
        threads.reserve(thread_count - 1);

        for (auto i = 0u; i < thread_count - 1; ++i) {
            threads.emplace_back([&io_context]() {
                io_context.run();
            });
        }

        // 主线程也运行 IO
        io_context.run();

        for (auto& t : threads) {
            if (t.joinable()) {
                t.join();
            }
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Relay Server shutdown complete" << std::endl;
    return 0;
}

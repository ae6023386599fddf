/**
 * @file main.cpp
 * @brief Peer Endpoint 主程序入口
 *
 * 用法: duet_peer_endpoint [config.yaml] [room]
 * 标准输入命令: mic / cam / kick / leave / status
 */

#include "peer_endpoint/command_input.hpp"
#include "peer_endpoint/config.hpp"
#include "peer_endpoint/identity.hpp"
#include "peer_endpoint/local_media.hpp"
#include "peer_endpoint/relay_client.hpp"
#include "peer_endpoint/rtc_session_transport.hpp"
#include "peer_endpoint/session_coordinator.hpp"
#include "peer_endpoint/websocket_relay_channel.hpp"

#include "duet/logger.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <unistd.h>

namespace net = boost::asio;

namespace {

void print_status(const duet::peer::SessionStatus& status) {
    std::cout << "[status] connected=" << (status.connected ? "yes" : "no")
              << " connecting=" << (status.connecting ? "yes" : "no");
    if (status.error) {
        std::cout << " error=\"" << *status.error << "\"";
    }
    std::cout << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/peer_endpoint.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }

    duet::peer::Config config;
    if (!config.load_from_file(config_path)) {
        std::cerr << "Failed to load config from: " << config_path << std::endl;
        std::cerr << "Using default configuration" << std::endl;
    }
    config.load_from_env();
    duet::set_log_level(duet::parse_log_level(config.logging.level));

    const std::string room_id = (argc > 2) ? argv[2] : duet::peer::generate_room_name();
    const std::string peer_id = duet::peer::generate_peer_id();

    std::cout << "=== Duet Peer Endpoint ===" << std::endl;
    std::cout << "Config: " << config_path << std::endl;
    std::cout << "Relay: " << config.relay.url << std::endl;
    std::cout << "Room: " << room_id << std::endl;
    std::cout << "Peer: " << peer_id << std::endl;

    try {
        net::io_context io_context;
        auto work = net::make_work_guard(io_context);

        const std::string relay_url = config.relay.url;
        auto relay = std::make_shared<duet::peer::RelayClient>(
            io_context,
            [&io_context, relay_url]() -> std::shared_ptr<duet::peer::RelayChannel> {
                return std::make_shared<duet::peer::WebSocketRelayChannel>(io_context, relay_url);
            },
            peer_id,
            config.relay);

        auto transports = std::make_shared<duet::peer::RtcTransportFactory>(config.webrtc);
        auto coordinator = std::make_shared<duet::peer::SessionCoordinator>(
            io_context, relay, transports, config);

        bool stopping = false;
        net::steady_timer flush_timer(io_context);
        net::signal_set signals(io_context, SIGINT, SIGTERM);
        std::shared_ptr<duet::peer::CommandInput> input;

        // 退出房间后给 Leave 和 unsubscribe 一点时间发出去
        auto stop = [&]() {
            if (stopping) return;
            stopping = true;
            coordinator->shutdown();
            signals.cancel();
            if (input) input->cancel();
            work.reset();
            flush_timer.expires_after(std::chrono::milliseconds(500));
            flush_timer.async_wait([&io_context](const boost::system::error_code&) {
                io_context.stop();
            });
        };

        coordinator->set_status_callback(print_status);
        coordinator->set_state_callback([](duet::peer::SessionState state) {
            std::cout << "[state] " << duet::peer::to_string(state) << std::endl;
        });
        coordinator->set_remote_media_callback(
            [](const std::optional<duet::peer::RemoteMedia>& media) {
                if (!media) {
                    std::cout << "[remote] no remote media" << std::endl;
                    return;
                }
                std::cout << "[remote] " << media->tracks.size() << " remote track(s)" << std::endl;
            });
        coordinator->set_exit_callback([&](duet::peer::ExitReason reason) {
            std::cout << "[exit] " << duet::peer::to_string(reason) << std::endl;
            net::post(io_context, stop);
        });

        auto handle_command = [&](const std::string& line) {
            if (line == "mic") {
                bool on = coordinator->toggle_local_audio();
                std::cout << "[mic] " << (on ? "on" : "off") << std::endl;
            } else if (line == "cam") {
                bool on = coordinator->toggle_local_video();
                std::cout << "[cam] " << (on ? "on" : "off") << std::endl;
            } else if (line == "kick") {
                coordinator->force_remove_peer();
            } else if (line == "leave") {
                stop();
            } else if (line == "status") {
                std::cout << "[state] " << duet::peer::to_string(coordinator->state()) << std::endl;
                print_status(coordinator->status());
            } else if (!line.empty()) {
                std::cout << "commands: mic | cam | kick | leave | status" << std::endl;
            }
        };

        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if (ec) return;
            std::cout << "\nReceived signal " << signal << ", shutting down..." << std::endl;
            stop();
        });

        coordinator->start(room_id);

        // 本地媒体只是描述，采集在进程外完成
        if (auto media = duet::peer::LocalMedia::from_config(config.media)) {
            coordinator->set_local_media(media);
        } else {
            coordinator->report_media_unavailable("audio and video disabled in config");
        }

        // 标准输入命令在 io_context 上读取，stop() 时取消
        input = std::make_shared<duet::peer::CommandInput>(io_context, handle_command);
        const int input_fd = ::dup(STDIN_FILENO);
        if (input_fd < 0 || !input->open(input_fd)) {
            LOG_WARN("stdin unavailable, commands disabled");
        }

        io_context.run();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Peer Endpoint shutdown complete" << std::endl;
    return 0;
}

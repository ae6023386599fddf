#pragma once

#include <string>

namespace duet::peer {

// 本进程的参与者标识（16 位十六进制随机串）
std::string generate_peer_id();

// 随机房间名，例如 "sunnyriver42"
std::string generate_room_name();

} // namespace duet::peer

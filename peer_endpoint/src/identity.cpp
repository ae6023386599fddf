#include "peer_endpoint/identity.hpp"

#include <array>
#include <iomanip>
#include <random>
#include <sstream>

namespace duet::peer {

namespace {
    const std::array<const char*, 10> kAdjectives = {
        "purple", "happy", "sunny", "brave", "calm",
        "swift", "bright", "silent", "misty", "cool"
    };
    const std::array<const char*, 10> kNouns = {
        "flower", "mountain", "river", "sky", "ocean",
        "forest", "tiger", "eagle", "moon", "star"
    };
}

std::string generate_peer_id() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 8; ++i) {
        ss << std::setw(2) << dis(gen);
    }

    return ss.str();
}

std::string generate_room_name() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<size_t> adj(0, kAdjectives.size() - 1);
    std::uniform_int_distribution<size_t> noun(0, kNouns.size() - 1);
    std::uniform_int_distribution<> num(0, 99);

    return std::string(kAdjectives[adj(gen)]) + kNouns[noun(gen)] + std::to_string(num(gen));
}

} // namespace duet::peer

#include "peer_endpoint/signal_message.hpp"

using json = nlohmann::json;

namespace duet::peer {

const char* kind_to_string(SignalKind kind) {
    switch (kind) {
        case SignalKind::Join: return "join";
        case SignalKind::Offer: return "offer";
        case SignalKind::Answer: return "answer";
        case SignalKind::IceCandidate: return "ice-candidate";
        case SignalKind::Leave: return "leave";
        case SignalKind::Kick: return "kick";
    }
    return "unknown";
}

std::optional<SignalKind> kind_from_string(const std::string& name) {
    if (name == "join") return SignalKind::Join;
    if (name == "offer") return SignalKind::Offer;
    if (name == "answer") return SignalKind::Answer;
    if (name == "ice-candidate") return SignalKind::IceCandidate;
    if (name == "leave") return SignalKind::Leave;
    if (name == "kick") return SignalKind::Kick;
    return std::nullopt;
}

json message_to_json(const SignalMessage& msg) {
    json j;
    j["type"] = kind_to_string(msg.kind);
    if (msg.payload && !msg.payload->is_null()) j["payload"] = *msg.payload;
    j["roomId"] = msg.room_id;
    j["senderId"] = msg.sender_id;
    return j;
}

std::optional<SignalMessage> json_to_message(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    auto type = j.find("type");
    auto room = j.find("roomId");
    auto sender = j.find("senderId");
    if (type == j.end() || !type->is_string() ||
        room == j.end() || !room->is_string() ||
        sender == j.end() || !sender->is_string()) {
        return std::nullopt;
    }

    auto kind = kind_from_string(type->get<std::string>());
    if (!kind) {
        return std::nullopt;
    }

    SignalMessage msg;
    msg.kind = *kind;
    msg.room_id = room->get<std::string>();
    msg.sender_id = sender->get<std::string>();
    if (msg.sender_id.empty()) {
        return std::nullopt;
    }

    auto payload = j.find("payload");
    if (payload != j.end() && !payload->is_null()) {
        msg.payload = *payload;
    }
    return msg;
}

json description_to_json(const SessionDescription& desc) {
    json j;
    j["type"] = desc.type;
    j["sdp"] = desc.sdp;
    return j;
}

std::optional<SessionDescription> json_to_description(const json& j) {
    if (!j.is_object()) return std::nullopt;
    auto type = j.find("type");
    auto sdp = j.find("sdp");
    if (type == j.end() || !type->is_string() || sdp == j.end() || !sdp->is_string()) {
        return std::nullopt;
    }
    SessionDescription desc;
    desc.type = type->get<std::string>();
    desc.sdp = sdp->get<std::string>();
    return desc;
}

json candidate_to_json(const IceCandidate& cand) {
    json j;
    j["candidate"] = cand.candidate;
    j["sdpMid"] = cand.sdp_mid;
    if (cand.sdp_mline_index >= 0) j["sdpMLineIndex"] = cand.sdp_mline_index;
    return j;
}

std::optional<IceCandidate> json_to_candidate(const json& j) {
    if (!j.is_object()) return std::nullopt;
    auto cand = j.find("candidate");
    if (cand == j.end() || !cand->is_string()) {
        return std::nullopt;
    }
    IceCandidate out;
    out.candidate = cand->get<std::string>();
    auto mid = j.find("sdpMid");
    if (mid != j.end() && mid->is_string()) out.sdp_mid = mid->get<std::string>();
    auto index = j.find("sdpMLineIndex");
    if (index != j.end() && index->is_number_integer()) out.sdp_mline_index = index->get<int>();
    return out;
}

} // namespace duet::peer

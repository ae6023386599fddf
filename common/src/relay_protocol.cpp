/**
 * @file relay_protocol.cpp
 * @brief 中继帧编解码实现
 */

#include "duet/relay_protocol.hpp"

using json = nlohmann::json;

namespace duet::protocol {

std::string encode_frame(const RelayFrame& frame) {
    json j;
    j["op"] = frame.op;
    if (!frame.topic.empty()) j["topic"] = frame.topic;
    if (!frame.event.empty()) j["event"] = frame.event;
    if (!frame.payload.is_null()) j["payload"] = frame.payload;
    if (!frame.status.empty()) j["status"] = frame.status;
    if (!frame.detail.empty()) j["detail"] = frame.detail;
    if (frame.op == kOpPublish || frame.op == kOpAck) {
        j["ref"] = frame.ref;
    }
    if (frame.op == kOpAck) {
        j["ok"] = frame.ok;
    }
    return j.dump();
}

std::optional<RelayFrame> decode_frame(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    RelayFrame frame;
    try {
        frame.op = j.value("op", "");
        frame.topic = j.value("topic", "");
        frame.event = j.value("event", "");
        frame.status = j.value("status", "");
        frame.detail = j.value("detail", "");
        frame.ref = j.value("ref", static_cast<int64_t>(0));
        frame.ok = j.value("ok", true);
    } catch (const json::exception&) {
        // 字段类型不符
        return std::nullopt;
    }
    if (frame.op.empty()) {
        return std::nullopt;
    }
    if (j.contains("payload")) {
        frame.payload = j["payload"];
    }
    return frame;
}

RelayFrame make_subscribe(const std::string& topic) {
    RelayFrame frame;
    frame.op = kOpSubscribe;
    frame.topic = topic;
    return frame;
}

RelayFrame make_unsubscribe(const std::string& topic) {
    RelayFrame frame;
    frame.op = kOpUnsubscribe;
    frame.topic = topic;
    return frame;
}

RelayFrame make_publish(const std::string& topic, const json& payload, int64_t ref) {
    RelayFrame frame;
    frame.op = kOpPublish;
    frame.topic = topic;
    frame.event = kSignalEvent;
    frame.payload = payload;
    frame.ref = ref;
    return frame;
}

RelayFrame make_status(const std::string& topic, const std::string& status,
                       const std::string& detail) {
    RelayFrame frame;
    frame.op = kOpStatus;
    frame.topic = topic;
    frame.status = status;
    frame.detail = detail;
    return frame;
}

RelayFrame make_broadcast(const std::string& topic, const std::string& event,
                          const json& payload) {
    RelayFrame frame;
    frame.op = kOpBroadcast;
    frame.topic = topic;
    frame.event = event;
    frame.payload = payload;
    return frame;
}

RelayFrame make_ack(int64_t ref, bool ok, const std::string& detail) {
    RelayFrame frame;
    frame.op = kOpAck;
    frame.ref = ref;
    frame.ok = ok;
    frame.detail = detail;
    return frame;
}

} // namespace duet::protocol

/**
 * @file rtc_session_transport.cpp
 * @brief libdatachannel PeerConnection 封装
 */

#include "peer_endpoint/rtc_session_transport.hpp"
#include "peer_endpoint/errors.hpp"

#include "duet/logger.hpp"

#include <rtc/rtc.hpp>

namespace duet::peer {

namespace {
    TransportState map_state(rtc::PeerConnection::State state) {
        switch (state) {
            case rtc::PeerConnection::State::New: return TransportState::New;
            case rtc::PeerConnection::State::Connecting: return TransportState::Connecting;
            case rtc::PeerConnection::State::Connected: return TransportState::Connected;
            case rtc::PeerConnection::State::Disconnected: return TransportState::Disconnected;
            case rtc::PeerConnection::State::Failed: return TransportState::Failed;
            case rtc::PeerConnection::State::Closed: return TransportState::Closed;
        }
        return TransportState::Failed;
    }

    SignalingState map_signaling(rtc::PeerConnection::SignalingState state) {
        switch (state) {
            case rtc::PeerConnection::SignalingState::Stable: return SignalingState::Stable;
            case rtc::PeerConnection::SignalingState::HaveLocalOffer: return SignalingState::HaveLocalOffer;
            case rtc::PeerConnection::SignalingState::HaveRemoteOffer: return SignalingState::HaveRemoteOffer;
            case rtc::PeerConnection::SignalingState::HaveLocalPranswer: return SignalingState::HaveLocalPranswer;
            case rtc::PeerConnection::SignalingState::HaveRemotePranswer: return SignalingState::HaveRemotePranswer;
        }
        return SignalingState::Stable;
    }

    rtc::Configuration make_configuration(const WebRtcConfig& config) {
        rtc::Configuration rtc_config;
        for (const auto& server : config.ice_servers) {
            try {
                rtc::IceServer ice(server.urls);
                if (!server.username.empty()) {
                    ice.username = server.username;
                    ice.password = server.credential;
                }
                rtc_config.iceServers.push_back(ice);
            } catch (const std::exception& e) {
                LOG_WARN("[RtcSessionTransport] ignoring ICE server " << server.urls
                         << ": " << e.what());
            }
        }
        // offer/answer 完全由协调器驱动
        rtc_config.disableAutoNegotiation = true;
        return rtc_config;
    }
}

RtcSessionTransport::RtcSessionTransport(const WebRtcConfig& config, Callbacks callbacks)
    : hooks_(std::make_shared<Hooks>()) {
    hooks_->callbacks = std::move(callbacks);

    try {
        pc_ = std::make_shared<rtc::PeerConnection>(make_configuration(config));
    } catch (const std::exception& e) {
        throw SessionError(ErrorKind::NegotiationFailed,
                           std::string("PeerConnection creation failed: ") + e.what());
    }

    auto hooks = hooks_;

    pc_->onLocalCandidate([hooks](rtc::Candidate cand) {
        CandidateCallback cb;
        {
            std::lock_guard<std::mutex> lock(hooks->mutex);
            if (!hooks->active) return;
            cb = hooks->callbacks.on_local_candidate;
        }
        if (cb) {
            IceCandidate ice;
            ice.candidate = cand.candidate();
            ice.sdp_mid = cand.mid();
            cb(ice);
        }
    });

    pc_->onStateChange([hooks](rtc::PeerConnection::State state) {
        StateCallback cb;
        {
            std::lock_guard<std::mutex> lock(hooks->mutex);
            if (!hooks->active) return;
            cb = hooks->callbacks.on_state;
        }
        if (cb) cb(map_state(state));
    });

    pc_->onTrack([hooks](std::shared_ptr<rtc::Track> track) {
        TrackCallback cb;
        {
            std::lock_guard<std::mutex> lock(hooks->mutex);
            if (!hooks->active) return;
            cb = hooks->callbacks.on_remote_track;
        }
        if (cb && track) {
            RemoteTrack remote;
            remote.mid = track->mid();
            remote.kind = track->description().type();
            cb(remote);
        }
    });
}

RtcSessionTransport::~RtcSessionTransport() {
    close();
}

SignalingState RtcSessionTransport::signaling_state() const {
    return map_signaling(pc_->signalingState());
}

TransportState RtcSessionTransport::connection_state() const {
    return map_state(pc_->state());
}

SessionDescription RtcSessionTransport::create_offer() {
    return create_local(true);
}

SessionDescription RtcSessionTransport::create_answer() {
    return create_local(false);
}

SessionDescription RtcSessionTransport::create_local(bool offer) {
    const char* what = offer ? "offer" : "answer";
    try {
        pc_->setLocalDescription(offer ? rtc::Description::Type::Offer
                                       : rtc::Description::Type::Answer);
    } catch (const std::exception& e) {
        throw SessionError(ErrorKind::NegotiationFailed,
                           std::string("failed to create ") + what + ": " + e.what());
    }

    auto local = pc_->localDescription();
    if (!local) {
        throw SessionError(ErrorKind::NegotiationFailed,
                           std::string("no local description after creating ") + what);
    }

    SessionDescription desc;
    desc.type = local->typeString();
    desc.sdp = std::string(*local);
    return desc;
}

void RtcSessionTransport::rollback() {
    try {
        pc_->setLocalDescription(rtc::Description::Type::Rollback);
    } catch (const std::exception& e) {
        throw SessionError(ErrorKind::NegotiationFailed,
                           std::string("rollback failed: ") + e.what());
    }
}

void RtcSessionTransport::set_remote_description(const SessionDescription& desc) {
    try {
        pc_->setRemoteDescription(rtc::Description(desc.sdp, desc.type));
    } catch (const std::exception& e) {
        throw SessionError(ErrorKind::NegotiationFailed,
                           std::string("setRemoteDescription(") + desc.type + ") failed: " + e.what());
    }
}

void RtcSessionTransport::add_remote_candidate(const IceCandidate& candidate) {
    try {
        pc_->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.sdp_mid));
    } catch (const std::exception& e) {
        throw SessionError(ErrorKind::CandidateApplyFailed,
                           std::string("addRemoteCandidate failed: ") + e.what());
    }
}

void RtcSessionTransport::attach_local_media(const LocalMedia& media) {
    for (const auto& track : media.tracks()) {
        if (local_tracks_.count(track.mid)) {
            // libdatachannel 没有 replaceTrack，已绑定的轨道保持不变
            continue;
        }

        try {
            std::shared_ptr<rtc::Track> added;
            if (track.kind == "audio") {
                rtc::Description::Audio audio(track.mid, rtc::Description::Direction::SendRecv);
                audio.addOpusCodec(111);
                added = pc_->addTrack(audio);
            } else if (track.kind == "video") {
                rtc::Description::Video video(track.mid, rtc::Description::Direction::SendRecv);
                video.addH264Codec(96);
                added = pc_->addTrack(video);
            } else {
                LOG_WARN("[RtcSessionTransport] unsupported track kind: " << track.kind);
                continue;
            }
            local_tracks_[track.mid] = added;
            LOG_DEBUG("[RtcSessionTransport] attached local " << track.kind << " track");
        } catch (const std::exception& e) {
            throw SessionError(ErrorKind::NegotiationFailed,
                               std::string("addTrack(") + track.kind + ") failed: " + e.what());
        }
    }
}

void RtcSessionTransport::close() {
    if (closed_.exchange(true)) return;

    {
        std::lock_guard<std::mutex> lock(hooks_->mutex);
        hooks_->active = false;
    }

    local_tracks_.clear();
    if (pc_) {
        pc_->close();
    }
}

std::unique_ptr<SessionTransport> RtcTransportFactory::create(SessionTransport::Callbacks callbacks) {
    return std::make_unique<RtcSessionTransport>(config_, std::move(callbacks));
}

} // namespace duet::peer

#include <rtvoice/webrtc/webrtc.hpp>
#include <rtvoice/core/logger.hpp>

namespace rtvoice::webrtc {

WebRtcError::WebRtcError(WebRtcErrorCode code, const std::string& message)
    : core::Error(core::ErrorCode::WebRtcError, message), code_(code) {}

nlohmann::json IceServer::toJson() const {
    nlohmann::json j;
    j["urls"] = urls;
    if (username) {
        j["username"] = *username;
    }
    if (credential) {
        j["credential"] = *credential;
    }
    return j;
}

IceServer IceServer::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw WebRtcError(WebRtcErrorCode::InvalidParameter, "ICE server entry must be an object");
    }

    IceServer server;
    if (auto it = json.find("urls"); it != json.end()) {
        if (it->is_string()) {
            server.urls.push_back(it->get<std::string>());
        } else if (it->is_array()) {
            for (const auto& url : *it) {
                if (url.is_string()) {
                    server.urls.push_back(url.get<std::string>());
                }
            }
        }
    }
    if (auto it = json.find("username"); it != json.end() && it->is_string()) {
        server.username = it->get<std::string>();
    }
    if (auto it = json.find("credential"); it != json.end() && it->is_string()) {
        server.credential = it->get<std::string>();
    }
    return server;
}

SessionDescription::SessionDescription(SdpType type, std::string sdp)
    : type_(type), sdp_(std::move(sdp)) {}

std::string SessionDescription::typeString() const {
    switch (type_) {
        case SdpType::Offer: return "offer";
        case SdpType::Answer: return "answer";
    }
    return "unknown";
}

std::string SessionDescription::toJson() const {
    nlohmann::json j;
    j["type"] = typeString();
    j["sdp"] = sdp_;
    return j.dump();
}

SessionDescription SessionDescription::fromJson(const std::string& json) {
    try {
        auto j = nlohmann::json::parse(json);

        std::string type_str = j.at("type").get<std::string>();
        SdpType type;
        if (type_str == "offer") type = SdpType::Offer;
        else if (type_str == "answer") type = SdpType::Answer;
        else throw std::invalid_argument("Unknown SDP type: " + type_str);

        return SessionDescription(type, j.at("sdp").get<std::string>());
    } catch (const std::exception& e) {
        core::Logger::error("Failed to parse SDP from JSON: {}", e.what());
        throw WebRtcError(WebRtcErrorCode::InvalidParameter,
                          "Failed to parse SDP: " + std::string(e.what()));
    }
}

const char* iceGatheringStateName(IceGatheringState state) {
    switch (state) {
        case IceGatheringState::New: return "new";
        case IceGatheringState::Gathering: return "gathering";
        case IceGatheringState::Complete: return "complete";
    }
    return "unknown";
}

const char* peerConnectionStateName(PeerConnectionState state) {
    switch (state) {
        case PeerConnectionState::New: return "new";
        case PeerConnectionState::Connecting: return "connecting";
        case PeerConnectionState::Connected: return "connected";
        case PeerConnectionState::Disconnected: return "disconnected";
        case PeerConnectionState::Failed: return "failed";
        case PeerConnectionState::Closed: return "closed";
    }
    return "unknown";
}

const char* dataChannelStateName(DataChannelState state) {
    switch (state) {
        case DataChannelState::Connecting: return "connecting";
        case DataChannelState::Open: return "open";
        case DataChannelState::Closing: return "closing";
        case DataChannelState::Closed: return "closed";
    }
    return "unknown";
}

} // namespace rtvoice::webrtc

#include <rtvoice/signaling/signaling.hpp>
#include <rtvoice/core/logger.hpp>

#include <nlohmann/json.hpp>

namespace rtvoice::signaling {

namespace {

core::ErrorCode codeForStatus(int status) {
    if (status == 401 || status == 403) {
        return core::ErrorCode::AuthenticationFailed;
    }
    return core::ErrorCode::SignalingFailed;
}

std::string truncate(const std::string& text, size_t limit = 200) {
    if (text.size() <= limit) {
        return text;
    }
    return text.substr(0, limit) + "...";
}

// Server error bodies look like {"message": "...", "hint": "..."}
SignalingError errorFromResponse(const std::string& context, const HttpResponse& response) {
    std::string message = context + " (" + std::to_string(response.status) + ")";
    std::string hint;

    auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (!body.is_discarded() && body.is_object()) {
        if (auto it = body.find("message"); it != body.end() && it->is_string()) {
            message = context + ": " + it->get<std::string>() + " (" + std::to_string(response.status) + ")";
        } else if (auto err = body.find("error"); err != body.end() && err->is_string()) {
            message = context + ": " + err->get<std::string>() + " (" + std::to_string(response.status) + ")";
        }
        if (auto it = body.find("hint"); it != body.end() && it->is_string()) {
            hint = it->get<std::string>();
        }
    } else if (!response.body.empty()) {
        message += " - " + truncate(response.body);
    }

    return SignalingError(response.status, response.body, message, hint);
}

} // namespace

SignalingError::SignalingError(int status, std::string body, const std::string& message, std::string hint)
    : core::Error(codeForStatus(status), message),
      status_(status),
      body_(std::move(body)),
      hint_(std::move(hint)) {}

std::string joinUrl(const std::string& server_url, const std::string& path) {
    std::string base = server_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + path;
}

Session parseSession(int status, const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw SignalingError(status, body, "Session creation returned an invalid body");
    }

    Session session;
    if (auto it = json.find("id"); it != json.end() && it->is_string()) {
        session.id = it->get<std::string>();
    } else {
        core::Logger::warn("Session response has no id");
        session.id = "unknown";
    }

    if (auto it = json.find("iceServers"); it != json.end() && it->is_array()) {
        for (const auto& entry : *it) {
            try {
                session.ice_servers.push_back(webrtc::IceServer::fromJson(entry));
            }
            catch (const webrtc::WebRtcError& e) {
                core::Logger::warn("Skipping ICE server entry: {}", e.what());
            }
        }
    }
    return session;
}

SignalingExchange::SignalingExchange(std::shared_ptr<HttpTransport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        core::throw_error(core::ErrorCode::InvalidArgument, "SignalingExchange requires a transport");
    }
}

Session SignalingExchange::createSession(const Credentials& credentials, const std::string& server_url) const {
    HttpRequest request;
    request.url = joinUrl(server_url, kSessionsPath);
    request.headers["Content-Type"] = "application/json";
    request.headers["X-Client-Id"] = credentials.client_id;
    request.headers["X-Client-Secret"] = credentials.client_secret;
    request.body = nlohmann::json{{"modalities", {"text", "audio"}}}.dump();

    core::Logger::info("Creating session...");
    auto response = transport_->send(request);
    if (response.status != 200) {
        throw errorFromResponse("Session creation failed", response);
    }

    auto session = parseSession(response.status, response.body);
    core::Logger::info("Session created: {} ({} ICE server(s))", session.id, session.ice_servers.size());
    return session;
}

webrtc::SessionDescription SignalingExchange::exchangeDescription(const Credentials& credentials,
                                                                  const std::string& server_url,
                                                                  const webrtc::SessionDescription& local) const {
    HttpRequest request;
    request.url = joinUrl(server_url, kRealtimePath);
    request.headers["Content-Type"] = "application/sdp";
    request.headers["X-Client-Id"] = credentials.client_id;
    request.headers["X-Client-Secret"] = credentials.client_secret;
    request.body = local.sdp();

    core::Logger::info("Sending SDP offer...");
    auto response = transport_->send(request);
    if (response.status != 200 && response.status != 201) {
        throw errorFromResponse("SDP exchange failed", response);
    }

    return webrtc::SessionDescription(webrtc::SdpType::Answer, response.body);
}

} // namespace rtvoice::signaling

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <rtvoice/core/error.hpp>
#include <rtvoice/signaling/http.hpp>
#include <rtvoice/webrtc/webrtc.hpp>

namespace rtvoice::signaling {

struct Credentials {
    std::string client_id;
    std::string client_secret;
};

// Realtime session as created by the service
struct Session {
    std::string id;
    std::vector<webrtc::IceServer> ice_servers;
};

// Non-success status (or unusable body) from one of the signaling calls
class SignalingError : public core::Error {
public:
    SignalingError(int status, std::string body, const std::string& message, std::string hint = {});

    int status() const noexcept { return status_; }
    const std::string& body() const noexcept { return body_; }
    const std::string& hint() const noexcept { return hint_; }

private:
    int status_;
    std::string body_;
    std::string hint_;
};

// Two-step out-of-band negotiation. No retries, no state between calls.
class SignalingExchange {
public:
    static constexpr const char* kSessionsPath = "/v1/realtime/sessions";
    static constexpr const char* kRealtimePath = "/v1/realtime";

    explicit SignalingExchange(std::shared_ptr<HttpTransport> transport);

    // POST {server}/v1/realtime/sessions, success is 200 only
    Session createSession(const Credentials& credentials, const std::string& server_url) const;

    // POST {server}/v1/realtime with the raw offer, success is 200 or 201.
    // Returns the answer description.
    webrtc::SessionDescription exchangeDescription(const Credentials& credentials,
                                                   const std::string& server_url,
                                                   const webrtc::SessionDescription& local) const;

private:
    std::shared_ptr<HttpTransport> transport_;
};

// "https://host/" + "/v1/x" -> "https://host/v1/x"
std::string joinUrl(const std::string& server_url, const std::string& path);

// Parse a session-create response body. Throws SignalingError when the body
// is not a JSON object.
Session parseSession(int status, const std::string& body);

} // namespace rtvoice::signaling

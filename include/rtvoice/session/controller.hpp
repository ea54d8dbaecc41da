#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <rtvoice/core/error.hpp>
#include <rtvoice/core/event.hpp>
#include <rtvoice/core/wait.hpp>
#include <rtvoice/media/device.hpp>
#include <rtvoice/media/playback.hpp>
#include <rtvoice/realtime/router.hpp>
#include <rtvoice/signaling/signaling.hpp>
#include <rtvoice/webrtc/webrtc.hpp>

namespace rtvoice::session {

enum class SessionState {
    Idle,
    Negotiating,
    AwaitingIce,
    Exchanging,
    Connected,
    Disconnecting,
    Closed
};

const char* sessionStateName(SessionState state);

// Capabilities the controller drives. Output backend may be null (no playback).
struct SessionDependencies {
    std::shared_ptr<signaling::HttpTransport> transport;
    std::shared_ptr<webrtc::PeerConnectionFactory> peer_factory;
    std::shared_ptr<media::AudioInputBackend> input_backend;
    std::shared_ptr<media::AudioOutputBackend> output_backend;
    std::vector<media::DeviceCandidate> device_candidates = media::defaultDeviceCandidates();
};

struct SessionOptions {
    signaling::Credentials credentials;
    std::string server_url;
    std::optional<std::string> device;
    // Default: no timeout, 100 ms polling
    core::WaitOptions ice_wait;
    std::optional<std::string> transcription_model;
    media::PlaybackOptions playback;
    std::string channel_label = "messages";
};

// Single-session, single-peer orchestrator:
// Idle -> Negotiating -> AwaitingIce -> Exchanging -> Connected -> Disconnecting -> Closed
class SessionController {
public:
    SessionController(SessionDependencies dependencies, SessionOptions options);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Blocks until Connected. On failure everything created so far is torn
    // down, the state becomes Closed and the error is rethrown:
    // SignalingError, media::DeviceError, core::Error(Cancelled) after
    // cancel(), core::Error(ConnectionTimeout) when the ICE wait times out.
    void connect();

    // Stop playback loops, close the channel and the peer connection.
    // No-op when nothing is connected.
    void disconnect();

    // Abort a pending ICE wait. Safe from any thread.
    void cancel();

    // Result of an externally handled function call. InvalidState when the
    // channel is not open.
    core::Result<void> sendFunctionResult(const std::string& call_id, const nlohmann::json& result);

    SessionState state() const noexcept { return state_.load(); }
    std::optional<signaling::Session> session() const;
    std::shared_ptr<media::AudioPlaybackPipeline> playback() const;

    core::EventEmitter<SessionState> onStateChange;
    core::EventEmitter<webrtc::PeerConnectionState> onConnectionStateChange;
    core::EventEmitter<const std::string&> onTranscript;
    core::EventEmitter<const std::string&> onAssistantDelta;
    core::EventEmitter<const std::string&> onAssistantMessage;
    core::EventEmitter<const std::string&, const nlohmann::json&, const std::string&> onFunctionCall;

private:
    class ChannelWriter;

    void setState(SessionState state);
    void establish();
    void teardown();

    SessionDependencies deps_;
    SessionOptions options_;
    signaling::SignalingExchange signaling_;

    std::atomic<SessionState> state_{SessionState::Idle};
    core::CancellationToken cancel_token_;

    // Held for the whole of connect() and disconnect()
    std::mutex lifecycle_mutex_;
    mutable std::mutex resources_mutex_;

    std::optional<signaling::Session> session_;
    std::shared_ptr<webrtc::PeerConnection> peer_;
    std::shared_ptr<webrtc::DataChannel> channel_;
    std::shared_ptr<media::AudioSource> source_;
    std::shared_ptr<media::AudioPlaybackPipeline> playback_;
    std::shared_ptr<ChannelWriter> writer_;
    std::shared_ptr<realtime::RealtimeEventRouter> router_;
};

} // namespace rtvoice::session

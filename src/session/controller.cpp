#include <rtvoice/session/controller.hpp>
#include <rtvoice/core/logger.hpp>

namespace rtvoice::session {

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Idle:          return "idle";
        case SessionState::Negotiating:   return "negotiating";
        case SessionState::AwaitingIce:   return "awaiting-ice";
        case SessionState::Exchanging:    return "exchanging";
        case SessionState::Connected:     return "connected";
        case SessionState::Disconnecting: return "disconnecting";
        case SessionState::Closed:        return "closed";
    }
    return "unknown";
}

// Serializes every outbound write on the data channel. Router responses and
// sendFunctionResult() share one instance, so a two-message batch is never
// split by another writer.
class SessionController::ChannelWriter : public realtime::EventWriter {
public:
    explicit ChannelWriter(std::weak_ptr<webrtc::DataChannel> channel)
        : channel_(std::move(channel)) {}

    core::Result<void> write(const std::vector<std::string>& messages) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto channel = channel_.lock();
        if (!channel || !channel->isOpen()) {
            core::Logger::warn("Data channel not ready, {} message(s) not sent", messages.size());
            return {core::ErrorCode::InvalidState, "Data channel not ready"};
        }

        for (const auto& message : messages) {
            try {
                channel->send(message);
            }
            catch (const core::Error& e) {
                return core::Error(e);
            }
        }
        return {};
    }

private:
    std::weak_ptr<webrtc::DataChannel> channel_;
    std::mutex mutex_;
};

SessionController::SessionController(SessionDependencies dependencies, SessionOptions options)
    : deps_(std::move(dependencies)),
      options_(std::move(options)),
      signaling_(deps_.transport) {
    if (!deps_.peer_factory) {
        core::throw_error(core::ErrorCode::InvalidArgument, "SessionController requires a peer connection factory");
    }
}

SessionController::~SessionController() {
    try {
        disconnect();
    }
    catch (const std::exception& e) {
        core::Logger::warn("Error during session teardown: {}", e.what());
    }
}

void SessionController::setState(SessionState state) {
    auto previous = state_.exchange(state);
    if (previous == state) {
        return;
    }
    core::Logger::debug("Session state: {} -> {}", sessionStateName(previous), sessionStateName(state));
    onStateChange.emit(state);
}

std::optional<signaling::Session> SessionController::session() const {
    std::lock_guard<std::mutex> lock(resources_mutex_);
    return session_;
}

std::shared_ptr<media::AudioPlaybackPipeline> SessionController::playback() const {
    std::lock_guard<std::mutex> lock(resources_mutex_);
    return playback_;
}

void SessionController::cancel() {
    cancel_token_.cancel();
}

void SessionController::connect() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    const auto current = state_.load();
    if (current != SessionState::Idle && current != SessionState::Closed) {
        core::throw_error(core::ErrorCode::InvalidState,
                          std::string("connect() called while ") + sessionStateName(current));
    }

    cancel_token_.reset();
    setState(SessionState::Negotiating);

    try {
        establish();
    }
    catch (const std::exception& e) {
        core::Logger::warn("Connection attempt aborted: {}", e.what());
        teardown();
        setState(SessionState::Closed);
        throw;
    }
}

void SessionController::establish() {
    auto session = signaling_.createSession(options_.credentials, options_.server_url);

    webrtc::Configuration config;
    config.ice_servers = session.ice_servers;

    auto peer = deps_.peer_factory->create(config);
    if (!peer) {
        throw webrtc::WebRtcError(webrtc::WebRtcErrorCode::ConnectionFailed, "Peer connection factory returned null");
    }

    {
        std::lock_guard<std::mutex> lock(resources_mutex_);
        session_ = session;
        peer_ = peer;
    }

    webrtc::DataChannelInit init;
    init.ordered = true;
    auto channel = peer->createDataChannel(options_.channel_label, init);
    if (!channel) {
        throw webrtc::WebRtcError(webrtc::WebRtcErrorCode::DataChannelError, "Could not create data channel");
    }

    auto writer = std::make_shared<ChannelWriter>(channel);
    auto playback = std::make_shared<media::AudioPlaybackPipeline>(deps_.output_backend, options_.playback);
    playback->start();

    realtime::RouterCallbacks callbacks;
    callbacks.on_transcript = [this](const std::string& text) { onTranscript.emit(text); };
    callbacks.on_assistant_delta = [this](const std::string& text) { onAssistantDelta.emit(text); };
    callbacks.on_assistant_message = [this](const std::string& text) { onAssistantMessage.emit(text); };
    callbacks.on_function_call = [this](const std::string& name, const nlohmann::json& arguments,
                                        const std::string& call_id) {
        onFunctionCall.emit(name, arguments, call_id);
    };
    auto router = std::make_shared<realtime::RealtimeEventRouter>(std::move(callbacks), writer, playback);

    {
        std::lock_guard<std::mutex> lock(resources_mutex_);
        channel_ = channel;
        writer_ = writer;
        playback_ = playback;
        router_ = router;
    }

    std::weak_ptr<ChannelWriter> weak_writer = writer;
    auto transcription_model = options_.transcription_model;
    channel->onOpen.connect([weak_writer, transcription_model]() {
        core::Logger::info("Data channel opened");
        if (!transcription_model) {
            return;
        }
        if (auto writer = weak_writer.lock()) {
            auto written = writer->write({realtime::encodeSessionUpdate(*transcription_model)});
            if (!written) {
                core::Logger::warn("Could not enable input transcription: {}", written.error().what());
            }
        }
    });

    std::weak_ptr<realtime::RealtimeEventRouter> weak_router = router;
    channel->onMessage.connect([weak_router](const std::string& message) {
        if (auto router = weak_router.lock()) {
            router->handleMessage(message);
        }
    });
    channel->onClose.connect([]() {
        core::Logger::info("Data channel closed");
    });

    std::weak_ptr<media::AudioPlaybackPipeline> weak_playback = playback;
    peer->onTrack.connect([weak_playback](std::shared_ptr<media::RemoteAudioTrack> track) {
        if (auto playback = weak_playback.lock()) {
            playback->addTrack(std::move(track));
        }
    });
    peer->onIceGatheringStateChange.connect([](webrtc::IceGatheringState state) {
        core::Logger::debug("ICE gathering state: {}", webrtc::iceGatheringStateName(state));
    });
    peer->onConnectionStateChange.connect([this](webrtc::PeerConnectionState state) {
        core::Logger::info("Peer connection state: {}", webrtc::peerConnectionStateName(state));
        onConnectionStateChange.emit(state);
    });

    // Mikrofon dipasang sebelum offer dibuat
    media::AudioDeviceSelector selector(deps_.input_backend, deps_.device_candidates);
    auto source = selector.select(options_.device);
    peer->addTrack(source);
    {
        std::lock_guard<std::mutex> lock(resources_mutex_);
        source_ = source;
    }

    auto offer = peer->createOffer();
    peer->setLocalDescription(offer);
    setState(SessionState::AwaitingIce);

    auto status = core::waitUntil(
        [&peer]() { return peer->iceGatheringState() == webrtc::IceGatheringState::Complete; },
        options_.ice_wait, &cancel_token_);

    if (status == core::WaitStatus::Cancelled) {
        throw core::Error(core::ErrorCode::Cancelled, "Connection cancelled while waiting for ICE gathering");
    }
    if (status == core::WaitStatus::TimedOut) {
        throw core::Error(core::ErrorCode::ConnectionTimeout, "ICE gathering did not complete in time");
    }

    setState(SessionState::Exchanging);
    auto local = peer->localDescription().value_or(offer);
    auto answer = signaling_.exchangeDescription(options_.credentials, options_.server_url, local);
    peer->setRemoteDescription(answer);

    setState(SessionState::Connected);
    core::Logger::info("Connected to {}", options_.server_url);
}

void SessionController::teardown() {
    std::shared_ptr<webrtc::PeerConnection> peer;
    std::shared_ptr<webrtc::DataChannel> channel;
    std::shared_ptr<media::AudioSource> source;
    std::shared_ptr<media::AudioPlaybackPipeline> playback;
    std::shared_ptr<realtime::RealtimeEventRouter> router;
    {
        std::lock_guard<std::mutex> lock(resources_mutex_);
        peer = std::move(peer_);
        channel = std::move(channel_);
        source = std::move(source_);
        playback = std::move(playback_);
        router = std::move(router_);
        writer_.reset();
    }

    // Track baru tidak boleh masuk lagi ke playback yang sedang dihentikan
    if (peer) {
        peer->onTrack.clear();
    }

    // Playback loops harus berhenti sebelum channel dan koneksi ditutup
    if (playback) {
        playback->stop();
    }

    if (channel) {
        try {
            channel->close();
        }
        catch (const std::exception& e) {
            core::Logger::warn("Error closing data channel: {}", e.what());
        }
        channel->onOpen.clear();
        channel->onMessage.clear();
        channel->onClose.clear();
    }

    if (peer) {
        try {
            peer->close();
        }
        catch (const std::exception& e) {
            core::Logger::warn("Error closing peer connection: {}", e.what());
        }
        peer->onIceGatheringStateChange.clear();
        peer->onConnectionStateChange.clear();
    }

    if (source) {
        try {
            source->stop();
        }
        catch (const std::exception& e) {
            core::Logger::warn("Error stopping microphone: {}", e.what());
        }
    }
}

void SessionController::disconnect() {
    cancel_token_.cancel();
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    const auto current = state_.load();
    if (current == SessionState::Idle || current == SessionState::Closed) {
        return;
    }

    setState(SessionState::Disconnecting);
    teardown();
    setState(SessionState::Closed);
    core::Logger::info("Disconnected");
}

core::Result<void> SessionController::sendFunctionResult(const std::string& call_id, const nlohmann::json& result) {
    std::shared_ptr<ChannelWriter> writer;
    {
        std::lock_guard<std::mutex> lock(resources_mutex_);
        writer = writer_;
    }
    if (!writer) {
        return {core::ErrorCode::InvalidState, "Session is not connected"};
    }
    return writer->write(realtime::functionResultMessages(call_id, result));
}

} // namespace rtvoice::session

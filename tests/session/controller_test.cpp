#include <gtest/gtest.h>
#include <rtvoice/session/controller.hpp>

#include <future>
#include <thread>

#include "fakes.hpp"

namespace rtvoice::session::test {

using rtvoice::test::FakeAudioInputBackend;
using rtvoice::test::FakeAudioOutputBackend;
using rtvoice::test::FakeAudioSource;
using rtvoice::test::FakeHttpTransport;
using rtvoice::test::FakePeerConnectionFactory;
using rtvoice::test::FakeRemoteAudioTrack;

using namespace std::chrono_literals;

namespace {

constexpr const char* kSessionBody = R"({
    "id": "sess_1",
    "iceServers": [{"urls": ["stun:stun.example.com:3478"]},
                   {"urls": "turn:turn.example.com", "username": "u", "credential": "p"}]
})";

constexpr const char* kAnswer = "v=0\r\no=- answer\r\n";

bool waitFor(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 2s) {
    core::WaitOptions options;
    options.poll_interval = 5ms;
    options.timeout = timeout;
    return core::waitUntil(predicate, options) == core::WaitStatus::Satisfied;
}

} // namespace

class ControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<FakeHttpTransport>();
        factory_ = std::make_shared<FakePeerConnectionFactory>();
        input_ = std::make_shared<FakeAudioInputBackend>();
        output_ = std::make_shared<FakeAudioOutputBackend>();

        input_->allow("default", media::DeviceFormat::PulseAudio);

        options_.credentials = {"client-1", "secret-1"};
        options_.server_url = "https://api.example.com";
        options_.ice_wait.poll_interval = 5ms;
        options_.playback.frame_poll = 10ms;
    }

    std::unique_ptr<SessionController> makeController() {
        SessionDependencies deps;
        deps.transport = transport_;
        deps.peer_factory = factory_;
        deps.input_backend = input_;
        deps.output_backend = output_;
        auto controller = std::make_unique<SessionController>(std::move(deps), options_);
        controller->onStateChange.connect([this](SessionState state) {
            std::lock_guard<std::mutex> lock(states_mutex_);
            states_.push_back(state);
        });
        return controller;
    }

    std::vector<SessionState> states() {
        std::lock_guard<std::mutex> lock(states_mutex_);
        return states_;
    }

    void respondHappyPath() {
        transport_->respond(signaling::SignalingExchange::kSessionsPath, 200, kSessionBody);
        transport_->respond(signaling::SignalingExchange::kRealtimePath, 201, kAnswer);
    }

    std::shared_ptr<FakeHttpTransport> transport_;
    std::shared_ptr<FakePeerConnectionFactory> factory_;
    std::shared_ptr<FakeAudioInputBackend> input_;
    std::shared_ptr<FakeAudioOutputBackend> output_;
    SessionOptions options_;

    std::mutex states_mutex_;
    std::vector<SessionState> states_;
};

TEST_F(ControllerTest, ConnectHappyPath) {
    respondHappyPath();
    auto controller = makeController();

    controller->connect();

    EXPECT_EQ(controller->state(), SessionState::Connected);
    EXPECT_EQ(states(), (std::vector<SessionState>{
        SessionState::Negotiating, SessionState::AwaitingIce,
        SessionState::Exchanging, SessionState::Connected}));

    auto peer = factory_->last();
    ASSERT_NE(peer, nullptr);
    EXPECT_EQ(peer->channel()->label(), "messages");
    EXPECT_TRUE(peer->channelInit().ordered);
    ASSERT_EQ(peer->tracks().size(), 1u);
    EXPECT_EQ(peer->offers(), 1);

    auto remote = peer->remoteDescription();
    ASSERT_TRUE(remote.has_value());
    EXPECT_EQ(remote->type(), webrtc::SdpType::Answer);
    EXPECT_EQ(remote->sdp(), kAnswer);

    EXPECT_EQ(controller->session()->id, "sess_1");
}

TEST_F(ControllerTest, IceServersPassedToPeerConnection) {
    respondHappyPath();
    auto controller = makeController();
    controller->connect();

    const auto& servers = factory_->last()->config().ice_servers;
    ASSERT_EQ(servers.size(), 2u);
    EXPECT_EQ(servers[0].urls, std::vector<std::string>{"stun:stun.example.com:3478"});
    EXPECT_EQ(servers[1].username.value(), "u");
    EXPECT_EQ(servers[1].credential.value(), "p");
}

TEST_F(ControllerTest, NoIceServersGivesEmptyConfiguration) {
    transport_->respond(signaling::SignalingExchange::kSessionsPath, 200, R"({"id":"sess_2"})");
    transport_->respond(signaling::SignalingExchange::kRealtimePath, 200, kAnswer);
    auto controller = makeController();
    controller->connect();

    EXPECT_TRUE(factory_->last()->config().ice_servers.empty());
}

TEST_F(ControllerTest, OfferSentAfterGatheringWithCandidates) {
    respondHappyPath();
    auto controller = makeController();
    controller->connect();

    auto requests = transport_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].url, "https://api.example.com/v1/realtime");
    EXPECT_EQ(requests[1].body, factory_->last()->localDescription()->sdp());
    EXPECT_NE(requests[1].body.find("a=candidate"), std::string::npos);
}

TEST_F(ControllerTest, SessionFailureNeverCreatesPeer) {
    transport_->respond(signaling::SignalingExchange::kSessionsPath, 403, R"({"message":"Client not registered","hint":"Register first"})");
    auto controller = makeController();

    EXPECT_THROW(controller->connect(), signaling::SignalingError);
    EXPECT_EQ(factory_->createdCount(), 0u);
    EXPECT_EQ(transport_->requestCount(), 1u);
    EXPECT_EQ(controller->state(), SessionState::Closed);
}

TEST_F(ControllerTest, NoMicrophoneAbortsBeforeExchange) {
    respondHappyPath();
    // Semua kandidat gagal
    input_ = std::make_shared<FakeAudioInputBackend>();
    auto controller = makeController();

    EXPECT_THROW(controller->connect(), media::DeviceError);
    EXPECT_EQ(transport_->requestCount(), 1u);
    EXPECT_EQ(input_->attempts().size(), media::defaultDeviceCandidates().size());

    auto peer = factory_->last();
    ASSERT_NE(peer, nullptr);
    EXPECT_TRUE(peer->isClosed());
    EXPECT_EQ(peer->offers(), 0);
    EXPECT_EQ(controller->state(), SessionState::Closed);
}

TEST_F(ControllerTest, ExplicitDeviceFailureIsFatal) {
    respondHappyPath();
    options_.device = ":3";
    auto controller = makeController();

    EXPECT_THROW(controller->connect(), media::DeviceError);
    ASSERT_EQ(input_->attempts().size(), 1u);
    EXPECT_EQ(input_->attempts()[0].format, media::DeviceFormat::AvFoundation);
}

TEST_F(ControllerTest, StaysAwaitingIceUntilCancelled) {
    respondHappyPath();
    factory_->setCompleteIce(false);
    auto controller = makeController();

    auto pending = std::async(std::launch::async, [&]() { controller->connect(); });

    ASSERT_TRUE(waitFor([&]() { return controller->state() == SessionState::AwaitingIce; }));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(controller->state(), SessionState::AwaitingIce);
    EXPECT_EQ(transport_->requestCount(), 1u);

    controller->cancel();
    try {
        pending.get();
        FAIL() << "Expected cancellation";
    }
    catch (const core::Error& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::Cancelled);
    }

    EXPECT_EQ(controller->state(), SessionState::Closed);
    EXPECT_EQ(transport_->requestCount(), 1u);
    EXPECT_TRUE(factory_->last()->isClosed());
}

TEST_F(ControllerTest, IceTimeout) {
    respondHappyPath();
    factory_->setCompleteIce(false);
    options_.ice_wait.timeout = 50ms;
    auto controller = makeController();

    try {
        controller->connect();
        FAIL() << "Expected timeout";
    }
    catch (const core::Error& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::ConnectionTimeout);
    }
    EXPECT_EQ(transport_->requestCount(), 1u);
    EXPECT_EQ(controller->state(), SessionState::Closed);
}

TEST_F(ControllerTest, ConnectTwiceRejected) {
    respondHappyPath();
    auto controller = makeController();
    controller->connect();

    try {
        controller->connect();
        FAIL() << "Expected InvalidState";
    }
    catch (const core::Error& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::InvalidState);
    }
    EXPECT_EQ(controller->state(), SessionState::Connected);
}

TEST_F(ControllerTest, DisconnectReleasesEverything) {
    respondHappyPath();
    auto controller = makeController();
    controller->connect();

    auto peer = factory_->last();
    auto channel = peer->channel();
    auto source = std::dynamic_pointer_cast<FakeAudioSource>(peer->tracks().at(0));

    controller->disconnect();

    EXPECT_EQ(controller->state(), SessionState::Closed);
    EXPECT_TRUE(peer->isClosed());
    EXPECT_TRUE(channel->wasClosed());
    ASSERT_NE(source, nullptr);
    EXPECT_TRUE(source->stopped());
    EXPECT_EQ(channel->onMessage.listenerCount(), 0u);
    EXPECT_EQ(peer->onTrack.listenerCount(), 0u);
    EXPECT_EQ(controller->playback(), nullptr);

    // Track yang diumumkan terlambat tidak diputar
    auto late = std::make_shared<FakeRemoteAudioTrack>("late");
    EXPECT_NO_THROW(peer->onTrack.emit(late));

    // Kedua kali tidak melakukan apa-apa
    EXPECT_NO_THROW(controller->disconnect());
}

TEST_F(ControllerTest, DisconnectWithoutConnectIsNoop) {
    auto controller = makeController();
    EXPECT_NO_THROW(controller->disconnect());
    EXPECT_EQ(controller->state(), SessionState::Idle);
    EXPECT_TRUE(states().empty());
}

TEST_F(ControllerTest, ReconnectAfterClose) {
    respondHappyPath();
    auto controller = makeController();
    controller->connect();
    controller->disconnect();

    controller->connect();
    EXPECT_EQ(controller->state(), SessionState::Connected);
    EXPECT_EQ(factory_->createdCount(), 2u);
}

TEST_F(ControllerTest, DataChannelEventsRouted) {
    respondHappyPath();
    auto controller = makeController();

    std::vector<std::string> transcripts;
    std::vector<std::string> deltas;
    std::vector<std::string> messages;
    controller->onTranscript.connect([&](const std::string& t) { transcripts.push_back(t); });
    controller->onAssistantDelta.connect([&](const std::string& t) { deltas.push_back(t); });
    controller->onAssistantMessage.connect([&](const std::string& t) { messages.push_back(t); });

    controller->connect();
    auto channel = factory_->last()->channel();
    channel->open();

    channel->receive(R"({"type":"conversation.item.input_audio_transcription.completed","transcript":"hello"})");
    channel->receive(R"({"type":"response.audio_transcript.delta","delta":"Hi"})");
    channel->receive(R"({"type":"response.audio_transcript.done","transcript":"Hi there"})");
    channel->receive("garbage");

    EXPECT_EQ(transcripts, std::vector<std::string>{"hello"});
    EXPECT_EQ(deltas, std::vector<std::string>{"Hi"});
    EXPECT_EQ(messages, std::vector<std::string>{"Hi there"});
    EXPECT_TRUE(channel->sent().empty());
}

TEST_F(ControllerTest, LocalFunctionAnsweredOnChannel) {
    respondHappyPath();
    auto controller = makeController();
    int forwarded = 0;
    controller->onFunctionCall.connect([&](const std::string&, const nlohmann::json&, const std::string&) {
        ++forwarded;
    });

    controller->connect();
    auto channel = factory_->last()->channel();
    channel->open();

    channel->receive(R"({"type":"response.output_item.done","item":{"type":"function_call",
        "name":"set_device_volume","call_id":"call-1","arguments":"{\"volume_level\":40}"}})");

    auto sent = channel->sent();
    ASSERT_EQ(sent.size(), 2u);
    auto output = realtime::decodeFunctionOutput(sent[0]);
    EXPECT_EQ(output.call_id, "call-1");
    EXPECT_EQ(output.result["volume"], 40);
    EXPECT_EQ(sent[1], realtime::encodeResponseCreate());
    EXPECT_EQ(forwarded, 0);
    EXPECT_EQ(controller->playback()->volume(), 40);
}

TEST_F(ControllerTest, RemoteFunctionForwardedAndAnswered) {
    respondHappyPath();
    auto controller = makeController();

    std::string call_id;
    std::string name;
    controller->onFunctionCall.connect([&](const std::string& n, const nlohmann::json&, const std::string& id) {
        name = n;
        call_id = id;
    });

    controller->connect();
    auto channel = factory_->last()->channel();

    // Belum open: hasil tidak bisa dikirim
    auto early = controller->sendFunctionResult("x", {{"ok", true}});
    ASSERT_TRUE(early.is_error());
    EXPECT_EQ(early.error().code(), core::ErrorCode::InvalidState);

    channel->open();
    channel->receive(R"({"type":"response.output_item.done","item":{"type":"function_call",
        "name":"get_weather","call_id":"call-7","arguments":"{}"}})");

    EXPECT_EQ(name, "get_weather");
    EXPECT_EQ(call_id, "call-7");
    EXPECT_TRUE(channel->sent().empty());

    ASSERT_TRUE(controller->sendFunctionResult(call_id, {{"temperature", 31}}).is_ok());
    auto sent = channel->sent();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(realtime::decodeFunctionOutput(sent[0]).result["temperature"], 31);
}

TEST_F(ControllerTest, SendFunctionResultWhenIdle) {
    auto controller = makeController();
    auto result = controller->sendFunctionResult("c", nlohmann::json::object());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::InvalidState);
}

TEST_F(ControllerTest, TranscriptionEnabledOnOpen) {
    respondHappyPath();
    options_.transcription_model = "whisper-1";
    auto controller = makeController();
    controller->connect();

    auto channel = factory_->last()->channel();
    channel->open();

    auto sent = channel->sent();
    ASSERT_EQ(sent.size(), 1u);
    auto update = nlohmann::json::parse(sent[0]);
    EXPECT_EQ(update["type"], "session.update");
    EXPECT_EQ(update["session"]["input_audio_transcription"]["model"], "whisper-1");
}

TEST_F(ControllerTest, RemoteTrackPlayed) {
    respondHappyPath();
    auto controller = makeController();
    controller->connect();

    auto track = std::make_shared<FakeRemoteAudioTrack>();
    factory_->last()->onTrack.emit(track);

    std::vector<int16_t> samples = {3, 4, 5};
    track->push(media::AudioFrame(samples.data(), samples.size() * sizeof(int16_t),
                                  media::AudioSampleFormat::S16, 24000, 1));
    ASSERT_TRUE(output_->sink()->waitForBlocks(1));
    EXPECT_EQ(output_->sink()->written()[0], samples);

    controller->disconnect();
}

TEST_F(ControllerTest, ConnectionStateForwarded) {
    respondHappyPath();
    auto controller = makeController();
    std::vector<webrtc::PeerConnectionState> seen;
    controller->onConnectionStateChange.connect([&](webrtc::PeerConnectionState s) { seen.push_back(s); });

    controller->connect();
    factory_->last()->setConnectionState(webrtc::PeerConnectionState::Connected);
    factory_->last()->setConnectionState(webrtc::PeerConnectionState::Failed);

    EXPECT_EQ(seen, (std::vector<webrtc::PeerConnectionState>{
        webrtc::PeerConnectionState::Connected, webrtc::PeerConnectionState::Failed}));
}

TEST(ControllerConstructionTest, RequiresFactory) {
    SessionDependencies deps;
    deps.transport = std::make_shared<FakeHttpTransport>();
    EXPECT_THROW(SessionController(std::move(deps), SessionOptions{}), core::Error);
}

TEST(SessionStateTest, Names) {
    EXPECT_STREQ(sessionStateName(SessionState::AwaitingIce), "awaiting-ice");
    EXPECT_STREQ(sessionStateName(SessionState::Closed), "closed");
}

} // namespace rtvoice::session::test

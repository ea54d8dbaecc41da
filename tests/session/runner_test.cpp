#include <gtest/gtest.h>
#include <rtvoice/session/runner.hpp>

#include <future>
#include <thread>

#include "fakes.hpp"

namespace rtvoice::session::test {

using rtvoice::test::FakeAudioInputBackend;
using rtvoice::test::FakeHttpTransport;
using rtvoice::test::FakePeerConnectionFactory;

using namespace std::chrono_literals;

class RunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<FakeHttpTransport>();
        factory_ = std::make_shared<FakePeerConnectionFactory>();
        input_ = std::make_shared<FakeAudioInputBackend>();
        input_->allow("default", media::DeviceFormat::PulseAudio);

        transport_->respond(signaling::SignalingExchange::kSessionsPath, 200, R"({"id":"sess_1"})");
        transport_->respond(signaling::SignalingExchange::kRealtimePath, 200, "v=0\r\n");

        options_.client_id = "client-1";
        options_.client_secret = "secret-1";
        options_.server_url = "http://test.local";
        options_.duration_seconds = 1;
    }

    SessionDependencies dependencies() {
        SessionDependencies deps;
        deps.transport = transport_;
        deps.peer_factory = factory_;
        deps.input_backend = input_;
        return deps;
    }

    bool waitForState(ClientRunner& runner, SessionState state) {
        core::WaitOptions options;
        options.poll_interval = 5ms;
        options.timeout = 5s;
        return core::waitUntil([&]() { return runner.controller().state() == state; }, options) ==
               core::WaitStatus::Satisfied;
    }

    std::shared_ptr<FakeHttpTransport> transport_;
    std::shared_ptr<FakePeerConnectionFactory> factory_;
    std::shared_ptr<FakeAudioInputBackend> input_;
    ClientOptions options_;
};

TEST_F(RunnerTest, DurationElapsedExitsZero) {
    ClientRunner runner(options_, dependencies());

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(runner.run(), 0);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 1s);
    EXPECT_LT(elapsed, 10s);
    EXPECT_EQ(runner.controller().state(), SessionState::Closed);
    EXPECT_TRUE(factory_->last()->isClosed());
}

TEST_F(RunnerTest, SignalingFailureExitsOne) {
    transport_->respond(signaling::SignalingExchange::kSessionsPath, 401,
                        R"({"message":"Unknown client","hint":"Register the client id"})");
    ClientRunner runner(options_, dependencies());

    EXPECT_EQ(runner.run(), 1);
    EXPECT_EQ(factory_->createdCount(), 0u);
    EXPECT_EQ(runner.controller().state(), SessionState::Closed);
}

TEST_F(RunnerTest, TransportFailureExitsOne) {
    transport_->failWith(core::ErrorCode::NetworkError, "connection refused");
    ClientRunner runner(options_, dependencies());
    EXPECT_EQ(runner.run(), 1);
}

TEST_F(RunnerTest, StopDuringIceWaitExitsZero) {
    factory_->setCompleteIce(false);
    ClientRunner runner(options_, dependencies());

    auto stopper = std::async(std::launch::async, [&]() {
        if (waitForState(runner, SessionState::AwaitingIce)) {
            runner.requestStop();
        }
    });

    EXPECT_EQ(runner.run(), 0);
    stopper.get();

    EXPECT_EQ(runner.controller().state(), SessionState::Closed);
    // Offer tidak pernah dikirim
    EXPECT_EQ(transport_->requestCount(), 1u);
}

TEST_F(RunnerTest, StopWhileConnectedExitsZero) {
    options_.duration_seconds = 30;
    ClientRunner runner(options_, dependencies());

    auto stopper = std::async(std::launch::async, [&]() {
        if (waitForState(runner, SessionState::Connected)) {
            std::this_thread::sleep_for(100ms);
            runner.requestStop();
        }
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(runner.run(), 0);
    stopper.get();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
}

TEST_F(RunnerTest, ConnectionLostExitsOne) {
    options_.duration_seconds = 30;
    ClientRunner runner(options_, dependencies());

    auto breaker = std::async(std::launch::async, [&]() {
        if (waitForState(runner, SessionState::Connected)) {
            std::this_thread::sleep_for(200ms);
            factory_->last()->setConnectionState(webrtc::PeerConnectionState::Failed);
        }
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(runner.run(), 1);
    breaker.get();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
}

} // namespace rtvoice::session::test

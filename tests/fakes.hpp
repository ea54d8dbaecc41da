#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <rtvoice/media/device.hpp>
#include <rtvoice/media/media.hpp>
#include <rtvoice/media/playback.hpp>
#include <rtvoice/realtime/router.hpp>
#include <rtvoice/signaling/http.hpp>
#include <rtvoice/webrtc/webrtc.hpp>

// In-memory doubles for the capability interfaces, shared by all test suites
namespace rtvoice::test {

// Responses are routed by URL path suffix; unknown paths get 404
class FakeHttpTransport : public signaling::HttpTransport {
public:
    void respond(const std::string& path, int status, std::string body) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_[path] = {status, std::move(body), {}};
    }

    void failWith(core::ErrorCode code, std::string message) {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = std::make_pair(code, std::move(message));
    }

    signaling::HttpResponse send(const signaling::HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (failure_) {
            throw core::Error(failure_->first, failure_->second);
        }
        for (const auto& [path, response] : routes_) {
            if (request.url.size() >= path.size() &&
                request.url.compare(request.url.size() - path.size(), path.size(), path) == 0) {
                return response;
            }
        }
        return {404, "", {}};
    }

    std::vector<signaling::HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t requestCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, signaling::HttpResponse> routes_;
    std::vector<signaling::HttpRequest> requests_;
    std::optional<std::pair<core::ErrorCode, std::string>> failure_;
};

class FakeDataChannel : public webrtc::DataChannel {
public:
    explicit FakeDataChannel(std::string label) : label_(std::move(label)) {}

    std::string label() const override { return label_; }
    webrtc::DataChannelState state() const override { return state_.load(); }

    void send(const std::string& message) override {
        if (state_ != webrtc::DataChannelState::Open) {
            throw webrtc::WebRtcError(webrtc::WebRtcErrorCode::InvalidState, "Data channel is not open");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back(message);
    }

    void close() override {
        if (state_.exchange(webrtc::DataChannelState::Closed) != webrtc::DataChannelState::Closed) {
            onClose.emit();
        }
        closed_ = true;
    }

    // Simulasi remote: channel terbuka dan pesan masuk
    void open() {
        state_ = webrtc::DataChannelState::Open;
        onOpen.emit();
    }

    void receive(const std::string& message) {
        onMessage.emit(message);
    }

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    bool wasClosed() const { return closed_.load(); }

private:
    std::string label_;
    std::atomic<webrtc::DataChannelState> state_{webrtc::DataChannelState::Connecting};
    std::atomic<bool> closed_{false};
    mutable std::mutex mutex_;
    std::vector<std::string> sent_;
};

class FakePeerConnection : public webrtc::PeerConnection {
public:
    explicit FakePeerConnection(webrtc::Configuration config) : config_(std::move(config)) {}

    std::shared_ptr<webrtc::DataChannel> createDataChannel(const std::string& label,
                                                           const webrtc::DataChannelInit& init) override {
        channel_ = std::make_shared<FakeDataChannel>(label);
        channel_init_ = init;
        return channel_;
    }

    void addTrack(std::shared_ptr<media::AudioSource> source) override {
        tracks_.push_back(std::move(source));
    }

    webrtc::SessionDescription createOffer() override {
        ++offers_;
        return {webrtc::SdpType::Offer, "v=0\r\no=- offer\r\n"};
    }

    void setLocalDescription(const webrtc::SessionDescription& description) override {
        std::lock_guard<std::mutex> lock(mutex_);
        local_ = description;
        if (complete_on_local_) {
            gathering_ = webrtc::IceGatheringState::Complete;
        } else {
            gathering_ = webrtc::IceGatheringState::Gathering;
        }
    }

    std::optional<webrtc::SessionDescription> localDescription() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!local_) {
            return std::nullopt;
        }
        return webrtc::SessionDescription(local_->type(), local_->sdp() + "a=candidate:1\r\n");
    }

    void setRemoteDescription(const webrtc::SessionDescription& description) override {
        std::lock_guard<std::mutex> lock(mutex_);
        remote_ = description;
    }

    webrtc::IceGatheringState iceGatheringState() const override { return gathering_.load(); }
    webrtc::PeerConnectionState connectionState() const override { return connection_.load(); }

    void close() override {
        closed_ = true;
        connection_ = webrtc::PeerConnectionState::Closed;
    }

    void setCompleteOnLocalDescription(bool complete) { complete_on_local_ = complete; }

    void setConnectionState(webrtc::PeerConnectionState state) {
        connection_ = state;
        onConnectionStateChange.emit(state);
    }

    const webrtc::Configuration& config() const { return config_; }
    const webrtc::DataChannelInit& channelInit() const { return channel_init_; }
    std::shared_ptr<FakeDataChannel> channel() const { return channel_; }
    const std::vector<std::shared_ptr<media::AudioSource>>& tracks() const { return tracks_; }
    std::optional<webrtc::SessionDescription> remoteDescription() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return remote_;
    }
    int offers() const { return offers_; }
    bool isClosed() const { return closed_.load(); }

private:
    webrtc::Configuration config_;
    webrtc::DataChannelInit channel_init_;
    std::shared_ptr<FakeDataChannel> channel_;
    std::vector<std::shared_ptr<media::AudioSource>> tracks_;

    mutable std::mutex mutex_;
    std::optional<webrtc::SessionDescription> local_;
    std::optional<webrtc::SessionDescription> remote_;

    std::atomic<bool> complete_on_local_{true};
    std::atomic<webrtc::IceGatheringState> gathering_{webrtc::IceGatheringState::New};
    std::atomic<webrtc::PeerConnectionState> connection_{webrtc::PeerConnectionState::New};
    std::atomic<bool> closed_{false};
    int offers_ = 0;
};

class FakePeerConnectionFactory : public webrtc::PeerConnectionFactory {
public:
    std::shared_ptr<webrtc::PeerConnection> create(const webrtc::Configuration& config) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto peer = std::make_shared<FakePeerConnection>(config);
        peer->setCompleteOnLocalDescription(complete_ice_);
        created_.push_back(peer);
        return peer;
    }

    // false: ICE gathering never completes
    void setCompleteIce(bool complete) { complete_ice_ = complete; }

    size_t createdCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_.size();
    }

    std::shared_ptr<FakePeerConnection> last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_.empty() ? nullptr : created_.back();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<FakePeerConnection>> created_;
    bool complete_ice_ = true;
};

class FakeAudioSource : public media::AudioSource {
public:
    explicit FakeAudioSource(media::DeviceCandidate candidate) : candidate_(std::move(candidate)) {}

    std::string id() const override { return candidate_.device; }
    std::string description() const override { return candidate_.describe(); }
    uint32_t sampleRate() const override { return 48000; }
    uint8_t channels() const override { return 1; }

    void start(media::AudioFrameCallback) override { started_ = true; }
    void stop() override { stopped_ = true; }

    const media::DeviceCandidate& candidate() const { return candidate_; }
    bool started() const { return started_.load(); }
    bool stopped() const { return stopped_.load(); }

private:
    media::DeviceCandidate candidate_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
};

// Candidates open successfully only when listed in `working`
class FakeAudioInputBackend : public media::AudioInputBackend {
public:
    void allow(const std::string& device, media::DeviceFormat format) {
        working_.push_back({device, format});
    }

    std::shared_ptr<media::AudioSource> open(const media::DeviceCandidate& candidate) override {
        attempts_.push_back(candidate);
        for (const auto& ok : working_) {
            if (ok.device == candidate.device && ok.format == candidate.format) {
                return std::make_shared<FakeAudioSource>(candidate);
            }
        }
        throw media::MediaError(media::MediaErrorCode::DeviceNotFound, "no such device: " + candidate.device);
    }

    const std::vector<media::DeviceCandidate>& attempts() const { return attempts_; }

private:
    std::vector<media::DeviceCandidate> working_;
    std::vector<media::DeviceCandidate> attempts_;
};

// Inbound track fed by the test
class FakeRemoteAudioTrack : public media::RemoteAudioTrack {
public:
    explicit FakeRemoteAudioTrack(std::string id = "remote-audio") : id_(std::move(id)) {}

    std::string id() const override { return id_; }

    std::optional<media::AudioFrame> nextFrame(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return !frames_.empty() || ended_ || cancelled_; });
        if (!frames_.empty()) {
            auto frame = std::move(frames_.front());
            frames_.pop_front();
            return frame;
        }
        if (ended_) {
            throw media::MediaStreamTerminated();
        }
        cancelled_ = false;
        return std::nullopt;
    }

    void cancel() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    void push(media::AudioFrame frame) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            frames_.push_back(std::move(frame));
        }
        cv_.notify_all();
    }

    void end() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ended_ = true;
        }
        cv_.notify_all();
    }

private:
    std::string id_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<media::AudioFrame> frames_;
    bool ended_ = false;
    bool cancelled_ = false;
};

class FakeAudioSink : public media::AudioSink {
public:
    void write(const int16_t* samples, size_t count) override {
        std::lock_guard<std::mutex> lock(mutex_);
        written_.emplace_back(samples, samples + count);
        cv_.notify_all();
    }

    void close() override { closed_ = true; }

    bool waitForBlocks(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return written_.size() >= count; });
    }

    std::vector<std::vector<int16_t>> written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

    bool closed() const { return closed_.load(); }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::vector<int16_t>> written_;
    std::atomic<bool> closed_{false};
};

class FakeAudioOutputBackend : public media::AudioOutputBackend {
public:
    explicit FakeAudioOutputBackend(bool supported = true) : supported_(supported) {}

    std::unique_ptr<media::AudioSink> openSink(uint32_t sample_rate, uint8_t channels,
                                               size_t frames_per_block) override {
        if (!supported_) {
            throw media::MediaError(media::MediaErrorCode::NotSupported, "no playback on this platform");
        }
        sample_rate_ = sample_rate;
        channels_ = channels;
        frames_per_block_ = frames_per_block;

        // Sink dimiliki pipeline; test tetap memegang pointer mentah untuk assertion
        auto sink = std::make_unique<FakeAudioSink>();
        sink_ = sink.get();
        return sink;
    }

    FakeAudioSink* sink() const { return sink_; }
    uint32_t sampleRate() const { return sample_rate_; }
    uint8_t channels() const { return channels_; }
    size_t framesPerBlock() const { return frames_per_block_; }

private:
    bool supported_;
    FakeAudioSink* sink_ = nullptr;
    uint32_t sample_rate_ = 0;
    uint8_t channels_ = 0;
    size_t frames_per_block_ = 0;
};

class RecordingEventWriter : public realtime::EventWriter {
public:
    core::Result<void> write(const std::vector<std::string>& messages) override {
        batches.push_back(messages);
        if (fail) {
            return {core::ErrorCode::InvalidState, "Data channel not ready"};
        }
        return {};
    }

    size_t messageCount() const {
        size_t count = 0;
        for (const auto& batch : batches) {
            count += batch.size();
        }
        return count;
    }

    std::vector<std::vector<std::string>> batches;
    bool fail = false;
};

class FakeVolumeControl : public media::VolumeControl {
public:
    void setVolume(int level) override { calls.push_back("set:" + std::to_string(level)); }
    void adjustVolume(const std::string& action) override { calls.push_back("adjust:" + action); }
    void mute() override { calls.push_back("mute"); }
    void stopAudio() override { calls.push_back("stop"); }

    std::vector<std::string> calls;
};

} // namespace rtvoice::test

#include <rtvoice/webrtc/rtc_backend.hpp>
#include <rtvoice/core/logger.hpp>

#include <rtc/rtc.hpp>
#include <opus/opus.h>

#include <algorithm>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <random>

namespace rtvoice::webrtc {

namespace {

constexpr int kOpusPayloadType = 111;
constexpr int kOpusClockRate = 48000;
constexpr int kCaptureFrameSamples = 960;       // 20 ms @ 48 kHz
constexpr int kDecodeSampleRate = 24000;
constexpr int kDecodeChannels = 2;
constexpr int kMaxDecodeSamples = 2880;         // 120 ms @ 24 kHz
constexpr size_t kMaxQueuedFrames = 50;
constexpr size_t kRtpHeaderSize = 12;

PeerConnectionState toState(rtc::PeerConnection::State state) {
    switch (state) {
        case rtc::PeerConnection::State::New:          return PeerConnectionState::New;
        case rtc::PeerConnection::State::Connecting:   return PeerConnectionState::Connecting;
        case rtc::PeerConnection::State::Connected:    return PeerConnectionState::Connected;
        case rtc::PeerConnection::State::Disconnected: return PeerConnectionState::Disconnected;
        case rtc::PeerConnection::State::Failed:       return PeerConnectionState::Failed;
        case rtc::PeerConnection::State::Closed:       return PeerConnectionState::Closed;
    }
    return PeerConnectionState::Failed;
}

IceGatheringState toState(rtc::PeerConnection::GatheringState state) {
    switch (state) {
        case rtc::PeerConnection::GatheringState::New:        return IceGatheringState::New;
        case rtc::PeerConnection::GatheringState::InProgress: return IceGatheringState::Gathering;
        case rtc::PeerConnection::GatheringState::Complete:   return IceGatheringState::Complete;
    }
    return IceGatheringState::New;
}

// RTP payload tanpa header, CSRC dan extension. nullopt untuk RTCP / paket rusak.
std::optional<std::pair<const uint8_t*, size_t>> rtpPayload(const rtc::binary& packet) {
    if (packet.size() < kRtpHeaderSize) {
        return std::nullopt;
    }
    const auto* data = reinterpret_cast<const uint8_t*>(packet.data());
    if ((data[0] >> 6) != 2) {
        return std::nullopt;
    }
    const uint8_t payload_type = data[1] & 0x7F;
    if (payload_type >= 72 && payload_type <= 76) {
        return std::nullopt;
    }

    size_t offset = kRtpHeaderSize + 4 * (data[0] & 0x0F);
    if (data[0] & 0x10) {
        if (packet.size() < offset + 4) {
            return std::nullopt;
        }
        const size_t words = (static_cast<size_t>(data[offset + 2]) << 8) | data[offset + 3];
        offset += 4 + 4 * words;
    }

    size_t end = packet.size();
    if (data[0] & 0x20) {
        const uint8_t padding = data[end - 1];
        if (padding > end - offset) {
            return std::nullopt;
        }
        end -= padding;
    }
    if (offset >= end) {
        return std::nullopt;
    }
    return std::make_pair(data + offset, end - offset);
}

class RtcDataChannel : public DataChannel {
public:
    explicit RtcDataChannel(std::shared_ptr<rtc::DataChannel> channel)
        : channel_(std::move(channel)) {
        channel_->onOpen([this]() { onOpen.emit(); });
        channel_->onClosed([this]() { onClose.emit(); });
        channel_->onMessage([this](rtc::message_variant data) {
            if (auto* text = std::get_if<std::string>(&data)) {
                onMessage.emit(*text);
            } else {
                core::Logger::debug("Ignoring binary data channel message");
            }
        });
    }

    ~RtcDataChannel() override {
        channel_->onOpen(nullptr);
        channel_->onClosed(nullptr);
        channel_->onMessage(nullptr);
    }

    std::string label() const override { return channel_->label(); }

    DataChannelState state() const override {
        if (channel_->isOpen()) return DataChannelState::Open;
        if (channel_->isClosed()) return DataChannelState::Closed;
        return DataChannelState::Connecting;
    }

    void send(const std::string& message) override {
        if (!channel_->isOpen()) {
            throw WebRtcError(WebRtcErrorCode::InvalidState, "Data channel is not open");
        }
        try {
            channel_->send(message);
        }
        catch (const std::exception& e) {
            throw WebRtcError(WebRtcErrorCode::DataChannelError, e.what());
        }
    }

    void close() override {
        channel_->close();
    }

private:
    std::shared_ptr<rtc::DataChannel> channel_;
};

// Decoded inbound audio, queued until the playback loop pulls it
class RtcRemoteAudioTrack : public media::RemoteAudioTrack {
public:
    explicit RtcRemoteAudioTrack(std::string id) : id_(std::move(id)) {
        int error = OPUS_OK;
        decoder_ = opus_decoder_create(kDecodeSampleRate, kDecodeChannels, &error);
        if (error != OPUS_OK || !decoder_) {
            throw media::MediaError(media::MediaErrorCode::DeviceInitFailed,
                                    std::string("Failed to create Opus decoder: ") + opus_strerror(error));
        }
    }

    ~RtcRemoteAudioTrack() override {
        opus_decoder_destroy(decoder_);
    }

    std::string id() const override { return id_; }

    void push(const uint8_t* payload, size_t size) {
        int16_t pcm[kMaxDecodeSamples * kDecodeChannels];
        int samples = opus_decode(decoder_, payload, static_cast<opus_int32>(size), pcm, kMaxDecodeSamples, 0);
        if (samples <= 0) {
            core::Logger::debug("Opus decode failed: {}", opus_strerror(samples));
            return;
        }

        media::AudioFrame frame(pcm, static_cast<size_t>(samples) * kDecodeChannels * sizeof(int16_t),
                                media::AudioSampleFormat::S16, kDecodeSampleRate, kDecodeChannels);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (frames_.size() >= kMaxQueuedFrames) {
                frames_.pop_front();
            }
            frames_.push_back(std::move(frame));
        }
        cv_.notify_one();
    }

    void end() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ended_ = true;
        }
        cv_.notify_all();
    }

    std::optional<media::AudioFrame> nextFrame(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return !frames_.empty() || ended_ || cancelled_; });

        if (!frames_.empty() && !cancelled_) {
            auto frame = std::move(frames_.front());
            frames_.pop_front();
            return frame;
        }
        if (ended_) {
            throw media::MediaStreamTerminated("Remote audio track " + id_ + " closed");
        }
        return std::nullopt;
    }

    void cancel() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

private:
    std::string id_;
    OpusDecoder* decoder_ = nullptr;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<media::AudioFrame> frames_;
    bool ended_ = false;
    bool cancelled_ = false;
};

class RtcPeerConnection : public PeerConnection {
public:
    explicit RtcPeerConnection(const Configuration& config) {
        rtc::Configuration rtc_config;
        rtc_config.disableAutoNegotiation = true;

        for (const auto& server : config.ice_servers) {
            for (const auto& url : server.urls) {
                try {
                    rtc::IceServer ice(url);
                    if (server.username) ice.username = *server.username;
                    if (server.credential) ice.password = *server.credential;
                    rtc_config.iceServers.push_back(std::move(ice));
                }
                catch (const std::exception& e) {
                    core::Logger::warn("Skipping ICE server {}: {}", url, e.what());
                }
            }
        }

        pc_ = std::make_shared<rtc::PeerConnection>(rtc_config);

        pc_->onStateChange([this](rtc::PeerConnection::State state) {
            onConnectionStateChange.emit(toState(state));
        });
        pc_->onGatheringStateChange([this](rtc::PeerConnection::GatheringState state) {
            onIceGatheringStateChange.emit(toState(state));
        });

        std::random_device rd;
        ssrc_ = std::uniform_int_distribution<uint32_t>(1)(rd);
        sequence_ = static_cast<uint16_t>(rd());
        timestamp_ = rd();
    }

    ~RtcPeerConnection() override {
        close();
    }

    std::shared_ptr<DataChannel> createDataChannel(const std::string& label,
                                                   const DataChannelInit& init) override {
        rtc::DataChannelInit rtc_init;
        rtc_init.reliability.unordered = !init.ordered;
        if (init.max_retransmits) {
            rtc_init.reliability.maxRetransmits = static_cast<unsigned int>(*init.max_retransmits);
        }
        rtc_init.protocol = init.protocol;

        auto channel = pc_->createDataChannel(label, rtc_init);
        return std::make_shared<RtcDataChannel>(std::move(channel));
    }

    void addTrack(std::shared_ptr<media::AudioSource> source) override {
        if (audio_track_) {
            throw WebRtcError(WebRtcErrorCode::InvalidState, "An audio track is already attached");
        }

        int error = OPUS_OK;
        encoder_ = opus_encoder_create(kOpusClockRate, 1, OPUS_APPLICATION_VOIP, &error);
        if (error != OPUS_OK || !encoder_) {
            throw WebRtcError(WebRtcErrorCode::MediaStreamError,
                              std::string("Failed to create Opus encoder: ") + opus_strerror(error));
        }

        rtc::Description::Audio audio("audio", rtc::Description::Direction::SendRecv);
        audio.addOpusCodec(kOpusPayloadType);
        audio.addSSRC(ssrc_, "rtvoice-audio");
        audio_track_ = pc_->addTrack(audio);

        remote_ = std::make_shared<RtcRemoteAudioTrack>("remote-audio");
        auto remote = remote_;
        audio_track_->onMessage([remote](rtc::message_variant data) {
            if (auto* packet = std::get_if<rtc::binary>(&data)) {
                if (auto payload = rtpPayload(*packet)) {
                    remote->push(payload->first, payload->second);
                }
            }
        });
        audio_track_->onOpen([this]() {
            core::Logger::debug("Audio track open");
            onTrack.emit(remote_);
        });
        audio_track_->onClosed([remote]() { remote->end(); });

        source_ = std::move(source);
        source_->start([this](const media::AudioFrame& frame) { sendCapture(frame); });
    }

    SessionDescription createOffer() override {
        // libdatachannel membuat dan memasang offer dalam satu langkah
        pc_->setLocalDescription(rtc::Description::Type::Offer);
        auto local = pc_->localDescription();
        if (!local) {
            throw WebRtcError(WebRtcErrorCode::NegotiationFailed, "No local description after creating offer");
        }
        return SessionDescription(SdpType::Offer, std::string(*local));
    }

    void setLocalDescription(const SessionDescription& description) override {
        if (description.type() != SdpType::Offer) {
            throw WebRtcError(WebRtcErrorCode::InvalidParameter, "Only local offers are supported");
        }
        // Sudah dipasang oleh createOffer()
    }

    std::optional<SessionDescription> localDescription() const override {
        auto local = pc_->localDescription();
        if (!local) {
            return std::nullopt;
        }
        return SessionDescription(SdpType::Offer, std::string(*local));
    }

    void setRemoteDescription(const SessionDescription& description) override {
        try {
            pc_->setRemoteDescription(rtc::Description(description.sdp(), description.typeString()));
        }
        catch (const std::exception& e) {
            throw WebRtcError(WebRtcErrorCode::NegotiationFailed,
                              std::string("Invalid remote description: ") + e.what());
        }
    }

    IceGatheringState iceGatheringState() const override {
        return toState(pc_->gatheringState());
    }

    PeerConnectionState connectionState() const override {
        return toState(pc_->state());
    }

    void close() override {
        std::lock_guard<std::mutex> lock(close_mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;

        if (source_) {
            source_->stop();
        }
        if (audio_track_) {
            audio_track_->onMessage(nullptr);
            audio_track_->onOpen(nullptr);
        }
        if (remote_) {
            remote_->end();
        }
        pc_->close();
        pc_->onStateChange(nullptr);
        pc_->onGatheringStateChange(nullptr);

        std::lock_guard<std::mutex> send_lock(send_mutex_);
        if (encoder_) {
            opus_encoder_destroy(encoder_);
            encoder_ = nullptr;
        }
    }

private:
    void sendCapture(const media::AudioFrame& frame) {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (!encoder_ || !audio_track_ || !audio_track_->isOpen()) {
            return;
        }

        std::vector<int16_t> mono;
        try {
            mono = media::toMonoS16(frame);
        }
        catch (const media::MediaError& e) {
            core::Logger::debug("Dropping capture frame: {}", e.what());
            return;
        }

        pending_.insert(pending_.end(), mono.begin(), mono.end());
        while (pending_.size() >= kCaptureFrameSamples) {
            unsigned char encoded[1500];
            int bytes = opus_encode(encoder_, pending_.data(), kCaptureFrameSamples, encoded, sizeof(encoded));
            pending_.erase(pending_.begin(), pending_.begin() + kCaptureFrameSamples);
            if (bytes < 0) {
                core::Logger::warn("Opus encode failed: {}", opus_strerror(bytes));
                continue;
            }

            rtc::binary packet;
            packet.reserve(kRtpHeaderSize + static_cast<size_t>(bytes));
            packet.push_back(static_cast<std::byte>(0x80));
            packet.push_back(static_cast<std::byte>(kOpusPayloadType));
            packet.push_back(static_cast<std::byte>((sequence_ >> 8) & 0xFF));
            packet.push_back(static_cast<std::byte>(sequence_ & 0xFF));
            for (int shift = 24; shift >= 0; shift -= 8) {
                packet.push_back(static_cast<std::byte>((timestamp_ >> shift) & 0xFF));
            }
            for (int shift = 24; shift >= 0; shift -= 8) {
                packet.push_back(static_cast<std::byte>((ssrc_ >> shift) & 0xFF));
            }
            packet.insert(packet.end(), reinterpret_cast<const std::byte*>(encoded),
                          reinterpret_cast<const std::byte*>(encoded + bytes));

            ++sequence_;
            timestamp_ += kCaptureFrameSamples;

            try {
                audio_track_->send(std::move(packet));
            }
            catch (const std::exception& e) {
                core::Logger::debug("Audio RTP send failed: {}", e.what());
            }
        }
    }

    std::shared_ptr<rtc::PeerConnection> pc_;
    std::shared_ptr<rtc::Track> audio_track_;
    std::shared_ptr<RtcRemoteAudioTrack> remote_;
    std::shared_ptr<media::AudioSource> source_;

    OpusEncoder* encoder_ = nullptr;
    std::vector<int16_t> pending_;
    uint32_t ssrc_ = 0;
    uint16_t sequence_ = 0;
    uint32_t timestamp_ = 0;
    std::mutex send_mutex_;

    std::mutex close_mutex_;
    bool closed_ = false;
};

} // namespace

RtcPeerConnectionFactory::RtcPeerConnectionFactory() {
    rtc::InitLogger(rtc::LogLevel::Warning);
}

std::shared_ptr<PeerConnection> RtcPeerConnectionFactory::create(const Configuration& config) {
    try {
        return std::make_shared<RtcPeerConnection>(config);
    }
    catch (const WebRtcError&) {
        throw;
    }
    catch (const std::exception& e) {
        throw WebRtcError(WebRtcErrorCode::ConnectionFailed,
                          std::string("Failed to create peer connection: ") + e.what());
    }
}

} // namespace rtvoice::webrtc

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <rtvoice/core/error.hpp>

namespace rtvoice::media {

// Media error codes
enum class MediaErrorCode {
    Success = 0,
    DeviceNotFound,
    DeviceInUse,
    DeviceInitFailed,
    FormatNotSupported,
    InvalidParameter,
    EndOfStream,
    PlaybackFailed,
    NotSupported,
    UnknownError
};

class MediaError : public core::Error {
public:
    explicit MediaError(MediaErrorCode code, const std::string& message);
    MediaErrorCode mediaCode() const noexcept { return code_; }

private:
    MediaErrorCode code_;
};

// Expected end of an inbound track. Consumers treat it as normal termination.
class MediaStreamTerminated : public MediaError {
public:
    explicit MediaStreamTerminated(const std::string& message = "Media stream ended");
};

// A single inbound frame could not be converted or written.
class PlaybackFrameError : public MediaError {
public:
    explicit PlaybackFrameError(const std::string& message);
};

enum class AudioSampleFormat {
    U8,     // Unsigned 8-bit PCM
    S16,    // Signed 16-bit PCM
    S32,    // Signed 32-bit PCM
    F32,    // 32-bit float
    F64,    // 64-bit float
    Unknown
};

// Interleaved: L R L R ...   Planar: L L L ... R R R ...
enum class AudioLayout {
    Interleaved,
    Planar
};

size_t bytesPerSample(AudioSampleFormat format);
const char* sampleFormatName(AudioSampleFormat format);

// Fixed by the realtime protocol: 24 kHz mono, 20 ms playback blocks
inline constexpr uint32_t kProtocolSampleRate = 24000;
inline constexpr uint8_t kProtocolChannels = 1;
inline constexpr std::chrono::milliseconds kPlaybackBlockDuration{20};
inline constexpr size_t kPlaybackBlockSamples =
    kProtocolSampleRate * kPlaybackBlockDuration.count() / 1000;

// Audio frame containing PCM samples
class AudioFrame {
public:
    AudioFrame() = default;
    AudioFrame(AudioSampleFormat format, uint32_t sample_rate, uint8_t channels,
               size_t num_samples, AudioLayout layout = AudioLayout::Interleaved);
    AudioFrame(const void* data, size_t size, AudioSampleFormat format,
               uint32_t sample_rate, uint8_t channels,
               AudioLayout layout = AudioLayout::Interleaved);

    const uint8_t* data() const noexcept { return data_.data(); }
    uint8_t* data() noexcept { return data_.data(); }
    size_t size() const noexcept { return data_.size(); }
    AudioSampleFormat format() const noexcept { return format_; }
    AudioLayout layout() const noexcept { return layout_; }
    uint32_t sampleRate() const noexcept { return sample_rate_; }
    uint8_t channels() const noexcept { return channels_; }
    // Samples per channel
    size_t numSamples() const noexcept { return num_samples_; }

    std::chrono::microseconds duration() const;

    std::unique_ptr<AudioFrame> clone() const;

    AudioFrame(AudioFrame&&) noexcept = default;
    AudioFrame& operator=(AudioFrame&&) noexcept = default;

    AudioFrame(const AudioFrame&) = delete;
    AudioFrame& operator=(const AudioFrame&) = delete;

private:
    std::vector<uint8_t> data_;
    AudioSampleFormat format_ = AudioSampleFormat::Unknown;
    AudioLayout layout_ = AudioLayout::Interleaved;
    uint32_t sample_rate_ = 0;
    uint8_t channels_ = 0;
    size_t num_samples_ = 0;
};

// Collapse to channel 0 and convert to signed 16-bit.
// Floats are clamped to [-1, 1], scaled by 32767 and truncated; wider
// integers are clamped to the int16 range; U8 is re-centred, not rescaled.
// Throws PlaybackFrameError for frames that cannot be interpreted.
std::vector<int16_t> toMonoS16(const AudioFrame& frame);

using AudioFrameCallback = std::function<void(const AudioFrame&)>;

// Outbound capture source (microphone). Attached to the peer connection as
// the local audio track; the media engine pulls frames through the callback.
class AudioSource {
public:
    virtual ~AudioSource() = default;

    virtual std::string id() const = 0;
    virtual std::string description() const = 0;
    virtual uint32_t sampleRate() const = 0;
    virtual uint8_t channels() const = 0;

    virtual void start(AudioFrameCallback callback) = 0;
    virtual void stop() = 0;
};

// Inbound audio track announced by the peer connection
class RemoteAudioTrack {
public:
    virtual ~RemoteAudioTrack() = default;

    virtual std::string id() const = 0;

    // Wait up to `timeout` for the next frame. Returns nullopt on timeout or
    // after cancel(); throws MediaStreamTerminated once the track has ended.
    virtual std::optional<AudioFrame> nextFrame(std::chrono::milliseconds timeout) = 0;

    // Wake up a pending nextFrame()
    virtual void cancel() = 0;
};

// Playback sink with a fixed native format (S16)
class AudioSink {
public:
    virtual ~AudioSink() = default;

    virtual void write(const int16_t* samples, size_t count) = 0;
    virtual void close() = 0;
};

class AudioOutputBackend {
public:
    virtual ~AudioOutputBackend() = default;

    // Throws MediaError(NotSupported) when the platform has no playback sink,
    // any other MediaError when the device cannot be opened.
    virtual std::unique_ptr<AudioSink> openSink(uint32_t sample_rate,
                                                uint8_t channels,
                                                size_t frames_per_block) = 0;
};

} // namespace rtvoice::media

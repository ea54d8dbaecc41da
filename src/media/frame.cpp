#include <rtvoice/media/media.hpp>
#include <rtvoice/core/logger.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

namespace rtvoice::media {

MediaError::MediaError(MediaErrorCode code, const std::string& message)
    : core::Error(code == MediaErrorCode::DeviceNotFound ? core::ErrorCode::DeviceNotFound
                                                         : core::ErrorCode::MediaError,
                  message),
      code_(code) {}

MediaStreamTerminated::MediaStreamTerminated(const std::string& message)
    : MediaError(MediaErrorCode::EndOfStream, message) {}

PlaybackFrameError::PlaybackFrameError(const std::string& message)
    : MediaError(MediaErrorCode::PlaybackFailed, message) {}

size_t bytesPerSample(AudioSampleFormat format) {
    switch (format) {
        case AudioSampleFormat::U8:  return 1;
        case AudioSampleFormat::S16: return 2;
        case AudioSampleFormat::S32: return 4;
        case AudioSampleFormat::F32: return 4;
        case AudioSampleFormat::F64: return 8;
        default: break;
    }
    throw MediaError(MediaErrorCode::FormatNotSupported, "Unsupported audio format");
}

const char* sampleFormatName(AudioSampleFormat format) {
    switch (format) {
        case AudioSampleFormat::U8:  return "u8";
        case AudioSampleFormat::S16: return "s16";
        case AudioSampleFormat::S32: return "s32";
        case AudioSampleFormat::F32: return "f32";
        case AudioSampleFormat::F64: return "f64";
        default: return "unknown";
    }
}

// AudioFrame implementation
AudioFrame::AudioFrame(AudioSampleFormat format, uint32_t sample_rate,
                       uint8_t channels, size_t num_samples, AudioLayout layout)
    : format_(format), layout_(layout), sample_rate_(sample_rate), channels_(channels),
      num_samples_(num_samples) {
    data_.resize(num_samples * channels * bytesPerSample(format));
}

AudioFrame::AudioFrame(const void* data, size_t size, AudioSampleFormat format,
                       uint32_t sample_rate, uint8_t channels, AudioLayout layout)
    : format_(format), layout_(layout), sample_rate_(sample_rate), channels_(channels) {
    if (channels == 0) {
        throw MediaError(MediaErrorCode::InvalidParameter, "Audio frame needs at least one channel");
    }

    const size_t frame_bytes = channels * bytesPerSample(format);
    if (size % frame_bytes != 0) {
        throw MediaError(MediaErrorCode::InvalidParameter, "Invalid audio data size");
    }

    num_samples_ = size / frame_bytes;
    data_.resize(size);
    if (size > 0) {
        std::memcpy(data_.data(), data, size);
    }
}

std::chrono::microseconds AudioFrame::duration() const {
    if (sample_rate_ == 0) {
        return std::chrono::microseconds(0);
    }
    return std::chrono::microseconds(
        static_cast<uint64_t>(1000000ULL * num_samples_ / sample_rate_));
}

std::unique_ptr<AudioFrame> AudioFrame::clone() const {
    auto copy = std::make_unique<AudioFrame>();
    copy->data_ = data_;
    copy->format_ = format_;
    copy->layout_ = layout_;
    copy->sample_rate_ = sample_rate_;
    copy->channels_ = channels_;
    copy->num_samples_ = num_samples_;
    return copy;
}

namespace {

template<typename T>
T loadSample(const uint8_t* base, size_t index) {
    T value;
    std::memcpy(&value, base + index * sizeof(T), sizeof(T));
    return value;
}

int16_t clampToS16(int64_t value) {
    return static_cast<int16_t>(std::clamp<int64_t>(
        value,
        std::numeric_limits<int16_t>::min(),
        std::numeric_limits<int16_t>::max()));
}

int16_t floatToS16(double value) {
    if (std::isnan(value)) {
        return 0;
    }
    value = std::clamp(value, -1.0, 1.0);
    // Truncation toward zero, matching a plain integer cast of the scaled value
    return static_cast<int16_t>(value * 32767.0);
}

} // namespace

std::vector<int16_t> toMonoS16(const AudioFrame& frame) {
    if (frame.channels() == 0) {
        throw PlaybackFrameError("Audio frame has no channels");
    }

    const size_t count = frame.numSamples();
    const size_t width = bytesPerSample(frame.format());
    if (frame.size() < count * frame.channels() * width) {
        throw PlaybackFrameError("Audio frame is shorter than its declared shape");
    }

    // Index of channel 0, sample i, within the raw buffer (in samples)
    const size_t stride = frame.layout() == AudioLayout::Interleaved ? frame.channels() : 1;
    const uint8_t* base = frame.data();

    std::vector<int16_t> out(count);
    for (size_t i = 0; i < count; ++i) {
        const size_t index = i * stride;
        switch (frame.format()) {
            case AudioSampleFormat::S16:
                out[i] = loadSample<int16_t>(base, index);
                break;
            case AudioSampleFormat::S32:
                out[i] = clampToS16(loadSample<int32_t>(base, index));
                break;
            case AudioSampleFormat::U8:
                out[i] = static_cast<int16_t>(static_cast<int>(loadSample<uint8_t>(base, index)) - 128);
                break;
            case AudioSampleFormat::F32:
                out[i] = floatToS16(loadSample<float>(base, index));
                break;
            case AudioSampleFormat::F64:
                out[i] = floatToS16(loadSample<double>(base, index));
                break;
            default:
                throw PlaybackFrameError(std::string("Unsupported sample format: ") +
                                         sampleFormatName(frame.format()));
        }
    }
    return out;
}

} // namespace rtvoice::media

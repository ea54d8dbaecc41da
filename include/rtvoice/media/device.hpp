#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <rtvoice/core/error.hpp>
#include <rtvoice/media/media.hpp>

namespace rtvoice::media {

// Platform capture convention of a device specifier
enum class DeviceFormat {
    AvFoundation,   // macOS, ":<index>"
    DirectShow,     // Windows, "audio=<name>"
    PulseAudio,     // Linux
    Alsa            // Linux
};

const char* deviceFormatName(DeviceFormat format);

struct DeviceCandidate {
    std::string device;
    DeviceFormat format = DeviceFormat::PulseAudio;

    std::string describe() const;
};

// Deterministic format inference from specifier syntax:
// ":1" -> AvFoundation, "audio=Mic" -> DirectShow, anything else -> PulseAudio.
DeviceFormat inferDeviceFormat(std::string_view specifier);

// Fallback table tried in order when no device is specified
std::vector<DeviceCandidate> defaultDeviceCandidates();

struct DeviceAttempt {
    DeviceCandidate candidate;
    std::string reason;
};

class DeviceError : public MediaError {
public:
    DeviceError(const std::string& message, std::vector<DeviceAttempt> attempts);

    const std::vector<DeviceAttempt>& attempts() const noexcept { return attempts_; }

private:
    std::vector<DeviceAttempt> attempts_;
};

// Opens a capture device. Throws MediaError when the candidate is unusable.
class AudioInputBackend {
public:
    virtual ~AudioInputBackend() = default;

    virtual std::shared_ptr<AudioSource> open(const DeviceCandidate& candidate) = 0;
};

class AudioDeviceSelector {
public:
    explicit AudioDeviceSelector(std::shared_ptr<AudioInputBackend> backend,
                                 std::vector<DeviceCandidate> fallback = defaultDeviceCandidates());

    // Explicit specifier: exactly one attempt, failure is fatal.
    // No specifier: fallback table in order, first success wins.
    // Throws DeviceError listing every failed attempt.
    std::shared_ptr<AudioSource> select(const std::optional<std::string>& specifier) const;

    // Single attempt, failure captured instead of thrown
    core::Result<std::shared_ptr<AudioSource>> attempt(const DeviceCandidate& candidate) const;

    const std::vector<DeviceCandidate>& fallback() const noexcept { return fallback_; }

private:
    std::shared_ptr<AudioInputBackend> backend_;
    std::vector<DeviceCandidate> fallback_;
};

} // namespace rtvoice::media

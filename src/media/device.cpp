#include <rtvoice/media/device.hpp>
#include <rtvoice/core/logger.hpp>

#include <sstream>

namespace rtvoice::media {

const char* deviceFormatName(DeviceFormat format) {
    switch (format) {
        case DeviceFormat::AvFoundation: return "avfoundation";
        case DeviceFormat::DirectShow:   return "dshow";
        case DeviceFormat::PulseAudio:   return "pulse";
        case DeviceFormat::Alsa:         return "alsa";
    }
    return "unknown";
}

std::string DeviceCandidate::describe() const {
    return "'" + device + "' (" + deviceFormatName(format) + ")";
}

DeviceFormat inferDeviceFormat(std::string_view specifier) {
    if (!specifier.empty() && specifier.front() == ':') {
        return DeviceFormat::AvFoundation;
    }
    if (specifier.rfind("audio=", 0) == 0) {
        return DeviceFormat::DirectShow;
    }
    return DeviceFormat::PulseAudio;
}

std::vector<DeviceCandidate> defaultDeviceCandidates() {
    return {
        {"default", DeviceFormat::PulseAudio},
        {"default", DeviceFormat::Alsa},
        {":0", DeviceFormat::AvFoundation},
        {"audio=default", DeviceFormat::DirectShow},
    };
}

namespace {

std::string formatAttempts(const std::vector<DeviceAttempt>& attempts) {
    std::ostringstream oss;
    for (size_t i = 0; i < attempts.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << attempts[i].candidate.describe() << ": " << attempts[i].reason;
    }
    return oss.str();
}

} // namespace

DeviceError::DeviceError(const std::string& message, std::vector<DeviceAttempt> attempts)
    : MediaError(MediaErrorCode::DeviceNotFound,
                 attempts.empty() ? message : message + " [" + formatAttempts(attempts) + "]"),
      attempts_(std::move(attempts)) {}

AudioDeviceSelector::AudioDeviceSelector(std::shared_ptr<AudioInputBackend> backend,
                                         std::vector<DeviceCandidate> fallback)
    : backend_(std::move(backend)), fallback_(std::move(fallback)) {}

core::Result<std::shared_ptr<AudioSource>> AudioDeviceSelector::attempt(const DeviceCandidate& candidate) const {
    if (!backend_) {
        return {core::ErrorCode::NotSupported, "No audio input backend available"};
    }

    try {
        auto source = backend_->open(candidate);
        if (!source) {
            return {core::ErrorCode::DeviceNotFound, "Backend returned no source"};
        }
        return source;
    }
    catch (const core::Error& e) {
        return core::Error(e);
    }
    catch (const std::exception& e) {
        return {core::ErrorCode::MediaError, e.what()};
    }
}

std::shared_ptr<AudioSource> AudioDeviceSelector::select(const std::optional<std::string>& specifier) const {
    if (specifier && !specifier->empty()) {
        DeviceCandidate candidate{*specifier, inferDeviceFormat(*specifier)};
        core::Logger::info("Opening requested microphone {}", candidate.describe());

        auto result = attempt(candidate);
        if (!result) {
            throw DeviceError("Could not open requested microphone " + candidate.describe(),
                              {{candidate, result.error().what()}});
        }
        return std::move(result).value();
    }

    std::vector<DeviceAttempt> failures;
    for (const auto& candidate : fallback_) {
        auto result = attempt(candidate);
        if (result) {
            core::Logger::info("Using {} for microphone input", candidate.describe());
            return std::move(result).value();
        }
        core::Logger::debug("Microphone candidate {} failed: {}", candidate.describe(), result.error().what());
        failures.push_back({candidate, result.error().what()});
    }

    throw DeviceError("No microphone found, audio input is not possible. "
                      "Pass an explicit device (e.g. ':0', 'audio=<name>', 'default')",
                      std::move(failures));
}

} // namespace rtvoice::media

#pragma once

#include <memory>

#include <rtvoice/media/device.hpp>
#include <rtvoice/media/media.hpp>

namespace rtvoice::media {

// Pa_Initialize / Pa_Terminate for the lifetime of the owning backends
class PortAudioSystem {
public:
    PortAudioSystem();
    ~PortAudioSystem();

    PortAudioSystem(const PortAudioSystem&) = delete;
    PortAudioSystem& operator=(const PortAudioSystem&) = delete;

    static std::shared_ptr<PortAudioSystem> acquire();
};

// Microphone capture at 48 kHz mono S16, 20 ms frames.
// DeviceFormat picks the host API: Core Audio for ":<index>",
// DirectSound/WASAPI/MME for "audio=<name>", ALSA ("pulse" PCM or named
// device) for the Linux formats.
class PortAudioInputBackend : public AudioInputBackend {
public:
    static constexpr uint32_t kSampleRate = 48000;
    static constexpr size_t kFrameSamples = 960;

    PortAudioInputBackend();

    std::shared_ptr<AudioSource> open(const DeviceCandidate& candidate) override;

private:
    std::shared_ptr<PortAudioSystem> system_;
};

// Blocking output stream on the default output device
class PortAudioOutputBackend : public AudioOutputBackend {
public:
    PortAudioOutputBackend();

    std::unique_ptr<AudioSink> openSink(uint32_t sample_rate,
                                        uint8_t channels,
                                        size_t frames_per_block) override;

private:
    std::shared_ptr<PortAudioSystem> system_;
};

} // namespace rtvoice::media

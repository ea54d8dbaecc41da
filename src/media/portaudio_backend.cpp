#include <rtvoice/media/portaudio.hpp>
#include <rtvoice/core/logger.hpp>

#include <portaudio.h>

#include <atomic>
#include <cstdlib>
#include <mutex>
#include <thread>
#include <vector>

namespace rtvoice::media {

namespace {

void check(PaError err, MediaErrorCode code, const std::string& context) {
    if (err != paNoError) {
        throw MediaError(code, context + ": " + Pa_GetErrorText(err));
    }
}

PaHostApiIndex hostApi(PaHostApiTypeId type) {
    PaHostApiIndex index = Pa_HostApiTypeIdToHostApiIndex(type);
    return index < 0 ? -1 : index;
}

bool isInput(PaDeviceIndex device) {
    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
    return info && info->maxInputChannels > 0;
}

// Device pertama di host API yang namanya mengandung `name`
PaDeviceIndex findInputByName(PaHostApiIndex api, const std::string& name) {
    const PaHostApiInfo* api_info = Pa_GetHostApiInfo(api);
    if (!api_info) {
        return paNoDevice;
    }
    for (int i = 0; i < api_info->deviceCount; ++i) {
        PaDeviceIndex device = Pa_HostApiDeviceIndexToDeviceIndex(api, i);
        const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
        if (info && info->maxInputChannels > 0 && std::string(info->name).find(name) != std::string::npos) {
            return device;
        }
    }
    return paNoDevice;
}

PaDeviceIndex defaultInput(PaHostApiIndex api) {
    const PaHostApiInfo* info = Pa_GetHostApiInfo(api);
    if (!info || !isInput(info->defaultInputDevice)) {
        return paNoDevice;
    }
    return info->defaultInputDevice;
}

PaDeviceIndex resolveAvFoundation(const std::string& spec) {
    PaHostApiIndex api = hostApi(paCoreAudio);
    if (api < 0) {
        throw MediaError(MediaErrorCode::NotSupported, "Core Audio is not available on this platform");
    }

    // ":1" -> input device #1 of Core Audio
    char* end = nullptr;
    long index = std::strtol(spec.c_str() + 1, &end, 10);
    if (end == spec.c_str() + 1 || *end != '\0' || index < 0) {
        throw MediaError(MediaErrorCode::InvalidParameter, "Invalid avfoundation device '" + spec + "'");
    }

    const PaHostApiInfo* api_info = Pa_GetHostApiInfo(api);
    long seen = 0;
    for (int i = 0; api_info && i < api_info->deviceCount; ++i) {
        PaDeviceIndex device = Pa_HostApiDeviceIndexToDeviceIndex(api, i);
        if (!isInput(device)) {
            continue;
        }
        if (seen++ == index) {
            return device;
        }
    }
    return paNoDevice;
}

PaDeviceIndex resolveDirectShow(const std::string& spec) {
    const std::string name = spec.substr(std::string("audio=").size());
    for (PaHostApiTypeId type : {paDirectSound, paWASAPI, paMME}) {
        PaHostApiIndex api = hostApi(type);
        if (api < 0) {
            continue;
        }
        PaDeviceIndex device = (name.empty() || name == "default") ? defaultInput(api) : findInputByName(api, name);
        if (device != paNoDevice) {
            return device;
        }
    }
    if (hostApi(paDirectSound) < 0 && hostApi(paWASAPI) < 0 && hostApi(paMME) < 0) {
        throw MediaError(MediaErrorCode::NotSupported, "Windows audio APIs are not available on this platform");
    }
    return paNoDevice;
}

PaDeviceIndex resolveLinux(const DeviceCandidate& candidate) {
    PaHostApiIndex api = hostApi(paALSA);
    if (api < 0) {
        throw MediaError(MediaErrorCode::NotSupported, "ALSA is not available on this platform");
    }

    if (candidate.format == DeviceFormat::PulseAudio) {
        // PulseAudio lewat plugin ALSA "pulse"
        const std::string name = candidate.device == "default" ? "pulse" : candidate.device;
        return findInputByName(api, name);
    }

    if (candidate.device == "default") {
        return defaultInput(api);
    }
    return findInputByName(api, candidate.device);
}

PaDeviceIndex resolveInput(const DeviceCandidate& candidate) {
    switch (candidate.format) {
        case DeviceFormat::AvFoundation: return resolveAvFoundation(candidate.device);
        case DeviceFormat::DirectShow:   return resolveDirectShow(candidate.device);
        case DeviceFormat::PulseAudio:
        case DeviceFormat::Alsa:         return resolveLinux(candidate);
    }
    return paNoDevice;
}

class PortAudioSource : public AudioSource {
public:
    PortAudioSource(std::shared_ptr<PortAudioSystem> system, PaDeviceIndex device, std::string id)
        : system_(std::move(system)), id_(std::move(id)) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
        description_ = info ? info->name : "unknown";

        PaStreamParameters params{};
        params.device = device;
        params.channelCount = 1;
        params.sampleFormat = paInt16;
        params.suggestedLatency = info ? info->defaultLowInputLatency : 0.05;
        params.hostApiSpecificStreamInfo = nullptr;

        check(Pa_OpenStream(&stream_, &params, nullptr, PortAudioInputBackend::kSampleRate,
                            PortAudioInputBackend::kFrameSamples, paClipOff, nullptr, nullptr),
              MediaErrorCode::DeviceInitFailed, "Cannot open microphone " + description_);
    }

    ~PortAudioSource() override {
        stop();
        if (stream_) {
            Pa_CloseStream(stream_);
        }
    }

    std::string id() const override { return id_; }
    std::string description() const override { return description_; }
    uint32_t sampleRate() const override { return PortAudioInputBackend::kSampleRate; }
    uint8_t channels() const override { return 1; }

    void start(AudioFrameCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
        check(Pa_StartStream(stream_), MediaErrorCode::DeviceInitFailed, "Cannot start microphone");
        running_ = true;
        thread_ = std::thread([this, callback = std::move(callback)]() { captureLoop(callback); });
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        if (thread_.joinable()) {
            thread_.join();
        }
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            core::Logger::warn("Pa_StopStream: {}", Pa_GetErrorText(err));
        }
    }

private:
    void captureLoop(const AudioFrameCallback& callback) {
        std::vector<int16_t> buffer(PortAudioInputBackend::kFrameSamples);
        while (running_) {
            PaError err = Pa_ReadStream(stream_, buffer.data(), PortAudioInputBackend::kFrameSamples);
            if (err != paNoError && err != paInputOverflowed) {
                core::Logger::warn("Microphone read failed: {}", Pa_GetErrorText(err));
                break;
            }
            AudioFrame frame(buffer.data(), buffer.size() * sizeof(int16_t), AudioSampleFormat::S16,
                             PortAudioInputBackend::kSampleRate, 1);
            callback(frame);
        }
    }

    std::shared_ptr<PortAudioSystem> system_;
    std::string id_;
    std::string description_;
    PaStream* stream_ = nullptr;

    std::mutex mutex_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

class PortAudioSink : public AudioSink {
public:
    PortAudioSink(std::shared_ptr<PortAudioSystem> system, uint32_t sample_rate,
                  uint8_t channels, size_t frames_per_block)
        : system_(std::move(system)), channels_(channels) {
        PaDeviceIndex device = Pa_GetDefaultOutputDevice();
        if (device == paNoDevice) {
            throw MediaError(MediaErrorCode::NotSupported, "No audio output device");
        }
        const PaDeviceInfo* info = Pa_GetDeviceInfo(device);

        PaStreamParameters params{};
        params.device = device;
        params.channelCount = channels;
        params.sampleFormat = paInt16;
        params.suggestedLatency = info ? info->defaultLowOutputLatency : 0.05;
        params.hostApiSpecificStreamInfo = nullptr;

        check(Pa_OpenStream(&stream_, nullptr, &params, sample_rate,
                            static_cast<unsigned long>(frames_per_block), paClipOff, nullptr, nullptr),
              MediaErrorCode::DeviceInitFailed, "Cannot open audio output");
        check(Pa_StartStream(stream_), MediaErrorCode::DeviceInitFailed, "Cannot start audio output");
    }

    ~PortAudioSink() override {
        close();
    }

    void write(const int16_t* samples, size_t count) override {
        if (!stream_) {
            throw PlaybackFrameError("Audio output is closed");
        }
        PaError err = Pa_WriteStream(stream_, samples, static_cast<unsigned long>(count / channels_));
        if (err != paNoError && err != paOutputUnderflowed) {
            throw PlaybackFrameError(std::string("Audio output write failed: ") + Pa_GetErrorText(err));
        }
    }

    void close() override {
        if (!stream_) {
            return;
        }
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }

private:
    std::shared_ptr<PortAudioSystem> system_;
    uint8_t channels_;
    PaStream* stream_ = nullptr;
};

} // namespace

PortAudioSystem::PortAudioSystem() {
    check(Pa_Initialize(), MediaErrorCode::DeviceInitFailed, "PortAudio initialisation failed");
    core::Logger::debug("PortAudio initialised: {}", Pa_GetVersionText());
}

PortAudioSystem::~PortAudioSystem() {
    Pa_Terminate();
}

std::shared_ptr<PortAudioSystem> PortAudioSystem::acquire() {
    static std::mutex mutex;
    static std::weak_ptr<PortAudioSystem> current;

    std::lock_guard<std::mutex> lock(mutex);
    auto system = current.lock();
    if (!system) {
        system = std::make_shared<PortAudioSystem>();
        current = system;
    }
    return system;
}

PortAudioInputBackend::PortAudioInputBackend()
    : system_(PortAudioSystem::acquire()) {}

std::shared_ptr<AudioSource> PortAudioInputBackend::open(const DeviceCandidate& candidate) {
    PaDeviceIndex device = resolveInput(candidate);
    if (device == paNoDevice) {
        throw MediaError(MediaErrorCode::DeviceNotFound, "No input device matches " + candidate.describe());
    }
    return std::make_shared<PortAudioSource>(system_, device, candidate.device);
}

PortAudioOutputBackend::PortAudioOutputBackend()
    : system_(PortAudioSystem::acquire()) {}

std::unique_ptr<AudioSink> PortAudioOutputBackend::openSink(uint32_t sample_rate,
                                                            uint8_t channels,
                                                            size_t frames_per_block) {
    return std::make_unique<PortAudioSink>(system_, sample_rate, channels, frames_per_block);
}

} // namespace rtvoice::media

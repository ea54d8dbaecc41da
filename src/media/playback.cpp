#include <rtvoice/media/playback.hpp>
#include <rtvoice/core/logger.hpp>

#include <algorithm>

namespace rtvoice::media {

namespace {

constexpr int kVolumeStep = 10;

int clampVolume(int level) {
    return std::clamp(level, 0, 100);
}

} // namespace

AudioPlaybackPipeline::AudioPlaybackPipeline(std::shared_ptr<AudioOutputBackend> backend,
                                             PlaybackOptions options)
    : backend_(std::move(backend)),
      options_(options),
      volume_(clampVolume(options.initial_volume)) {}

AudioPlaybackPipeline::~AudioPlaybackPipeline() {
    stop();
}

bool AudioPlaybackPipeline::start() {
    if (started_.exchange(true)) {
        return playback_available_;
    }

    if (!backend_) {
        core::Logger::warn("No audio output backend on this platform, remote audio will not be played");
        return false;
    }

    try {
        auto sink = backend_->openSink(options_.sample_rate, options_.channels, options_.frames_per_block);
        {
            std::lock_guard<std::mutex> lock(sink_mutex_);
            sink_ = std::move(sink);
        }
        playback_available_ = sink_ != nullptr;
    }
    catch (const MediaError& e) {
        if (e.mediaCode() == MediaErrorCode::NotSupported) {
            core::Logger::warn("Audio playback not supported here ({}), continuing without playback", e.what());
        } else {
            core::Logger::warn("Could not open audio output ({}), continuing without playback", e.what());
        }
        playback_available_ = false;
    }

    if (playback_available_) {
        core::Logger::info("Audio playback ready: {} Hz, {} channel(s), {} samples per block",
                           options_.sample_rate, static_cast<int>(options_.channels),
                           options_.frames_per_block);
    }
    return playback_available_;
}

void AudioPlaybackPipeline::addTrack(std::shared_ptr<RemoteAudioTrack> track) {
    if (!track) {
        return;
    }
    if (stopping_) {
        core::Logger::debug("Ignoring track {} announced during shutdown", track->id());
        return;
    }
    if (!playback_available_) {
        core::Logger::info("Received remote audio track {} (playback unavailable, not consumed)", track->id());
        return;
    }

    const std::string id = track->id();

    auto worker = std::make_unique<TrackWorker>();
    worker->track = std::move(track);
    TrackWorker* raw = worker.get();

    std::lock_guard<std::mutex> lock(workers_mutex_);
    // stop() mungkin sudah jalan selama id() dipanggil
    if (stopping_) {
        core::Logger::debug("Ignoring track {} announced during shutdown", id);
        return;
    }
    core::Logger::info("Received remote audio track {}", id);

    // Bersihkan worker yang sudah selesai
    workers_.erase(
        std::remove_if(workers_.begin(), workers_.end(), [](const std::unique_ptr<TrackWorker>& w) {
            if (w->finished && w->thread.joinable()) {
                w->thread.join();
                return true;
            }
            return false;
        }),
        workers_.end());

    raw->thread = std::thread([this, raw]() { consume(*raw); });
    workers_.push_back(std::move(worker));
}

void AudioPlaybackPipeline::consume(TrackWorker& worker) {
    const auto& track = worker.track;

    while (!stopping_) {
        try {
            auto frame = track->nextFrame(options_.frame_poll);
            if (!frame) {
                continue;
            }
            playFrame(*frame);
        }
        catch (const MediaStreamTerminated&) {
            core::Logger::info("Remote audio track {} ended", track->id());
            break;
        }
        catch (const std::exception& e) {
            // Satu frame rusak tidak boleh menghentikan stream
            ++frame_errors_;
            core::Logger::warn("Audio playback error on track {}: {}", track->id(), e.what());
        }
    }

    worker.finished = true;
}

void AudioPlaybackPipeline::playFrame(const AudioFrame& frame) {
    if (audio_stopped_) {
        ++frames_dropped_;
        return;
    }

    auto samples = toMonoS16(frame);
    if (frame.sampleRate() != options_.sample_rate) {
        ++frames_dropped_;
        core::Logger::warn("Dropping {} Hz audio frame, playback runs at {} Hz",
                           frame.sampleRate(), options_.sample_rate);
        return;
    }

    const int volume = volume_.load();
    if (volume < 100) {
        for (auto& sample : samples) {
            sample = static_cast<int16_t>(static_cast<int32_t>(sample) * volume / 100);
        }
    }

    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (!sink_) {
        ++frames_dropped_;
        return;
    }
    const size_t block = std::max<size_t>(options_.frames_per_block, 1);
    for (size_t offset = 0; offset < samples.size(); offset += block) {
        sink_->write(samples.data() + offset, std::min(block, samples.size() - offset));
    }
    ++frames_played_;
}

void AudioPlaybackPipeline::stop() {
    std::vector<std::unique_ptr<TrackWorker>> workers;
    {
        // stopping_ dan workers_ berubah bersama, addTrack memeriksa keduanya di bawah lock yang sama
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (stopping_.exchange(true)) {
            return;
        }
        workers.swap(workers_);
    }

    for (auto& worker : workers) {
        worker->track->cancel();
    }
    for (auto& worker : workers) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }

    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
        try {
            sink_->close();
        }
        catch (const std::exception& e) {
            core::Logger::warn("Error closing audio output: {}", e.what());
        }
        sink_.reset();
    }
    playback_available_ = false;

    core::Logger::debug("Playback stopped: {} frames played, {} dropped, {} errors",
                        frames_played_.load(), frames_dropped_.load(), frame_errors_.load());
}

size_t AudioPlaybackPipeline::activeTracks() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return static_cast<size_t>(std::count_if(workers_.begin(), workers_.end(),
        [](const std::unique_ptr<TrackWorker>& w) { return !w->finished; }));
}

PlaybackStats AudioPlaybackPipeline::stats() const {
    return {frames_played_.load(), frames_dropped_.load(), frame_errors_.load()};
}

void AudioPlaybackPipeline::setVolume(int level) {
    volume_ = clampVolume(level);
    audio_stopped_ = false;
    core::Logger::info("Playback volume set to {}%", volume_.load());
}

void AudioPlaybackPipeline::adjustVolume(const std::string& action) {
    int current = volume_.load();
    if (action == "increase") {
        current = clampVolume(current + kVolumeStep);
    } else if (action == "decrease") {
        current = clampVolume(current - kVolumeStep);
    } else {
        core::Logger::warn("Unknown volume action '{}'", action);
        return;
    }
    volume_ = current;
    audio_stopped_ = false;
    core::Logger::info("Playback volume adjusted ({}) to {}%", action, current);
}

void AudioPlaybackPipeline::mute() {
    volume_ = 0;
    core::Logger::info("Playback muted");
}

void AudioPlaybackPipeline::stopAudio() {
    audio_stopped_ = true;
    core::Logger::info("Playback stopped by request");
}

void AudioPlaybackPipeline::resumeAudio() {
    audio_stopped_ = false;
}

} // namespace rtvoice::media

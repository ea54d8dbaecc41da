#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <rtvoice/media/media.hpp>

namespace rtvoice::media {

// Device-side effects requested by the assistant's local functions
class VolumeControl {
public:
    virtual ~VolumeControl() = default;

    virtual void setVolume(int level) = 0;
    // "increase" / "decrease"; anything else is ignored
    virtual void adjustVolume(const std::string& action) = 0;
    virtual void mute() = 0;
    virtual void stopAudio() = 0;
};

struct PlaybackOptions {
    uint32_t sample_rate = kProtocolSampleRate;
    uint8_t channels = kProtocolChannels;
    size_t frames_per_block = kPlaybackBlockSamples;
    // How long one nextFrame() call may block before re-checking cancellation
    std::chrono::milliseconds frame_poll{100};
    int initial_volume = 100;
};

struct PlaybackStats {
    uint64_t frames_played = 0;
    uint64_t frames_dropped = 0;
    uint64_t frame_errors = 0;
};

// Consumes inbound audio tracks and writes normalized mono S16 blocks to the
// playback sink, one consumer thread per track.
class AudioPlaybackPipeline : public VolumeControl {
public:
    explicit AudioPlaybackPipeline(std::shared_ptr<AudioOutputBackend> backend,
                                   PlaybackOptions options = {});
    ~AudioPlaybackPipeline() override;

    AudioPlaybackPipeline(const AudioPlaybackPipeline&) = delete;
    AudioPlaybackPipeline& operator=(const AudioPlaybackPipeline&) = delete;

    // Opens the sink. Returns false (and logs) when playback is unavailable;
    // tracks are then accepted but not consumed.
    bool start();

    // Spawn a consumer loop for an inbound track
    void addTrack(std::shared_ptr<RemoteAudioTrack> track);

    // Cancel every loop, wait for them to exit, close the sink. Idempotent.
    void stop();

    bool isPlaybackAvailable() const noexcept { return playback_available_.load(); }
    size_t activeTracks() const;
    PlaybackStats stats() const;

    // VolumeControl
    void setVolume(int level) override;
    void adjustVolume(const std::string& action) override;
    void mute() override;
    void stopAudio() override;
    void resumeAudio();

    int volume() const noexcept { return volume_.load(); }
    bool isAudioStopped() const noexcept { return audio_stopped_.load(); }

private:
    struct TrackWorker {
        std::shared_ptr<RemoteAudioTrack> track;
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    void consume(TrackWorker& worker);
    void playFrame(const AudioFrame& frame);

    std::shared_ptr<AudioOutputBackend> backend_;
    PlaybackOptions options_;

    std::unique_ptr<AudioSink> sink_;
    std::mutex sink_mutex_;

    std::vector<std::unique_ptr<TrackWorker>> workers_;
    mutable std::mutex workers_mutex_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> playback_available_{false};
    std::atomic<int> volume_;
    std::atomic<bool> audio_stopped_{false};

    std::atomic<uint64_t> frames_played_{0};
    std::atomic<uint64_t> frames_dropped_{0};
    std::atomic<uint64_t> frame_errors_{0};
};

} // namespace rtvoice::media

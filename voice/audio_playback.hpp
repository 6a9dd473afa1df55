#pragma once
#include <atomic>
#include <functional>
#include <optional>

#include "voice/audio_devices.hpp"
#include "voice/voice_types.hpp"
#include "voice/worker_pool.hpp"

namespace Voice {

/// Scoped ownership of the output device flag. Acquired with a
/// compare-and-swap, cleared exactly once by whichever lease object
/// still holds it when it is destroyed or released.
class PlaybackLease {
public:
    static std::optional<PlaybackLease> tryAcquire(std::atomic<bool>& flag);

    PlaybackLease(PlaybackLease&& other) noexcept;
    PlaybackLease& operator=(PlaybackLease&& other) noexcept;
    PlaybackLease(const PlaybackLease&) = delete;
    PlaybackLease& operator=(const PlaybackLease&) = delete;
    ~PlaybackLease();

    void release();
    bool held() const { return flag_ != nullptr; }

private:
    explicit PlaybackLease(std::atomic<bool>* flag) : flag_(flag) {}

    std::atomic<bool>* flag_;
};

/// AudioPlaybackController
/// One playback at a time. Each accepted play() runs on the playback pool:
/// validate PCM, open the output device, write the whole buffer, close.
class AudioPlaybackController {
public:
    using Completion = std::function<void(VoiceError)>;

    AudioPlaybackController(PlaybackDeviceFactory makeDevice,
                            WorkerPool& playbackPool,
                            unsigned bufferMs = 100);

    AudioPlaybackController(const AudioPlaybackController&) = delete;
    AudioPlaybackController& operator=(const AudioPlaybackController&) = delete;

    /// PlaybackBusy when another playback holds the device (the running one
    /// is not touched). Otherwise None, and onDone(result) is called from the
    /// playback thread after the device flag has been cleared.
    VoiceError play(PcmBuffer bytes, unsigned sampleRate, Completion onDone = {});

    bool isActive() const { return active_.load(); }
    unsigned completedPlaybacks() const { return completed_.load(); }

private:
    VoiceError runPlayback(const PcmBuffer& bytes, unsigned sampleRate);

    PlaybackDeviceFactory makeDevice_;
    WorkerPool& pool_;
    unsigned bufferMs_;

    std::atomic<bool> active_{false};
    std::atomic<unsigned> completed_{0};
};

} // namespace Voice

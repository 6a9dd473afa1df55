#include "voice/audio_playback.hpp"
#include "logger.hpp"

#include <exception>
#include <utility>

namespace Voice {

// ============================================================
// PlaybackLease
// ============================================================
std::optional<PlaybackLease> PlaybackLease::tryAcquire(std::atomic<bool>& flag) {
    bool expected = false;
    if (!flag.compare_exchange_strong(expected, true)) {
        return std::nullopt;
    }
    return PlaybackLease(&flag);
}

PlaybackLease::PlaybackLease(PlaybackLease&& other) noexcept
    : flag_(std::exchange(other.flag_, nullptr)) {}

PlaybackLease& PlaybackLease::operator=(PlaybackLease&& other) noexcept {
    if (this != &other) {
        release();
        flag_ = std::exchange(other.flag_, nullptr);
    }
    return *this;
}

PlaybackLease::~PlaybackLease() {
    release();
}

void PlaybackLease::release() {
    if (flag_) {
        flag_->store(false);
        flag_ = nullptr;
    }
}

// ============================================================
// AudioPlaybackController
// ============================================================
AudioPlaybackController::AudioPlaybackController(PlaybackDeviceFactory makeDevice,
                                                 WorkerPool& playbackPool,
                                                 unsigned bufferMs)
    : makeDevice_(std::move(makeDevice)),
      pool_(playbackPool),
      bufferMs_(bufferMs == 0 ? 100 : bufferMs) {}

VoiceError AudioPlaybackController::play(PcmBuffer bytes, unsigned sampleRate, Completion onDone) {
    auto lease = PlaybackLease::tryAcquire(active_);
    if (!lease) {
        LOG_WARN("Audio/Playback", "Already playing audio, request rejected");
        return VoiceError::PlaybackBusy;
    }

    LOG_DEBUG("Audio/Playback", "play() accepted: " + std::to_string(bytes.size()) +
                                " bytes at " + std::to_string(sampleRate) + " Hz");

    auto job = [this,
                held = std::move(*lease),
                bytes = std::move(bytes),
                sampleRate,
                onDone = std::move(onDone)]() mutable {
        VoiceError result;
        {
            PlaybackLease scoped = std::move(held);
            result = runPlayback(bytes, sampleRate);
        }
        completed_.fetch_add(1);

        if (onDone) {
            onDone(result);
        }
    };

    // If the pool refuses the job, destroying it releases the lease
    auto fut = pool_.submit(std::move(job));
    if (!fut.valid()) {
        LOG_ERROR("Audio/Playback", "Playback pool is not accepting work");
        return VoiceError::DeviceInitFailure;
    }
    return VoiceError::None;
}

VoiceError AudioPlaybackController::runPlayback(const PcmBuffer& bytes, unsigned sampleRate) {
    AudioFormat format;
    format.sampleRate = sampleRate;
    format.channels = ChannelLayout::Mono;
    format.encoding = SampleEncoding::Pcm16;

    if (sampleRate == 0 || bytes.empty() || bytes.size() % format.bytesPerFrame() != 0) {
        LOG_ERROR("Audio/Playback", "Not playable as 16-bit mono PCM: " +
                                    std::to_string(bytes.size()) + " bytes at " +
                                    std::to_string(sampleRate) + " Hz");
        return VoiceError::ParseFailure;
    }

    std::size_t bufferBytes = minBufferBytes(format, bufferMs_);
    LOG_TRACE("Audio/Playback", "Audio track buffer size: " + std::to_string(bufferBytes));

    auto device = makeDevice_ ? makeDevice_() : nullptr;
    if (!device || !device->open(format, bufferBytes)) {
        LOG_ERROR("Audio/Playback", "Could not open output device");
        return VoiceError::DeviceInitFailure;
    }

    try {
        device->write(bytes.data(), bytes.size());
    } catch (const std::exception& e) {
        LOG_ERROR("Audio/Playback", std::string("Error playing audio: ") + e.what());
        device->close();
        return VoiceError::DeviceWriteFailure;
    }

    device->close();
    LOG_DEBUG("Audio/Playback", "Audio playback completed");
    return VoiceError::None;
}

} // namespace Voice

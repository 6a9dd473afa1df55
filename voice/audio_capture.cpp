#include "voice/audio_capture.hpp"
#include "logger.hpp"

#include <exception>
#include <vector>

namespace Voice {

AudioCaptureController::AudioCaptureController(CaptureDeviceFactory makeDevice,
                                               WorkerPool& capturePool,
                                               unsigned chunkMs,
                                               std::chrono::milliseconds stopTimeout)
    : makeDevice_(std::move(makeDevice)),
      pool_(capturePool),
      chunkMs_(chunkMs == 0 ? 100 : chunkMs),
      stopTimeout_(stopTimeout) {}

AudioCaptureController::~AudioCaptureController() {
    if (capturing_.load()) {
        auto discarded = stop();
        if (discarded) {
            LOG_DEBUG("Audio/Capture", "Discarded " + std::to_string(discarded->size()) +
                                       " bytes at teardown");
        }
    }
}

VoiceError AudioCaptureController::start(const AudioFormat& format) {
    bool expected = false;
    if (!capturing_.compare_exchange_strong(expected, true)) {
        LOG_WARN("Audio/Capture", "Microphone already owned by an active capture");
        return VoiceError::DeviceInitFailure;
    }

    chunkBytes_ = minBufferBytes(format, chunkMs_);

    device_ = makeDevice_ ? makeDevice_() : nullptr;
    if (!device_ || !device_->open(format, chunkBytes_)) {
        LOG_ERROR("Audio/Capture", "Failed to initialize audio recorder");
        device_.reset();
        capturing_.store(false);
        return VoiceError::DeviceInitFailure;
    }

    buffer_.clear();
    buffer_.reserve(format.bytesPerSecond() * 4);
    running_.store(true);

    loopDone_ = pool_.submit([this]() { captureLoop(); });
    if (!loopDone_.valid()) {
        LOG_ERROR("Audio/Capture", "Capture pool is not accepting work");
        running_.store(false);
        releaseDevice();
        capturing_.store(false);
        return VoiceError::DeviceInitFailure;
    }

    LOG_DEBUG("Audio/Capture", "Recording started (" + std::to_string(format.sampleRate) +
                               " Hz, chunk " + std::to_string(chunkBytes_) + " bytes)");
    return VoiceError::None;
}

void AudioCaptureController::captureLoop() {
    std::vector<std::uint8_t> chunk(chunkBytes_);

    while (running_.load()) {
        long bytesRead = device_->read(chunk.data(), chunk.size());
        if (bytesRead < 0) {
            if (running_.load()) {
                LOG_ERROR("Audio/Capture", "Device read failed, ending capture early");
            }
            break;
        }
        buffer_.insert(buffer_.end(), chunk.begin(), chunk.begin() + bytesRead);
    }

    LOG_TRACE("Audio/Capture", "Capture loop exited with " + std::to_string(buffer_.size()) + " bytes");
}

std::optional<PcmBuffer> AudioCaptureController::stop() {
    if (!capturing_.load()) {
        return std::nullopt;
    }

    running_.store(false);

    if (loopDone_.valid()) {
        if (loopDone_.wait_for(stopTimeout_) != std::future_status::ready) {
            LOG_WARN("Audio/Capture", "Capture loop did not stop within " +
                                      std::to_string(stopTimeout_.count()) + " ms, aborting device");
            device_->abort();
            loopDone_.wait();
        }
        try {
            loopDone_.get();
        } catch (const std::exception& e) {
            LOG_ERROR("Audio/Capture", std::string("Capture loop ended abnormally: ") + e.what());
        }
    }

    releaseDevice();

    PcmBuffer out = std::move(buffer_);
    buffer_ = PcmBuffer{};
    capturing_.store(false);

    LOG_DEBUG("Audio/Capture", "Recording stopped, " + std::to_string(out.size()) + " bytes captured");
    return out;
}

void AudioCaptureController::releaseDevice() {
    if (device_) {
        device_->close();
        device_.reset();
    }
}

} // namespace Voice

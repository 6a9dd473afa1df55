#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <optional>

#include "voice/audio_devices.hpp"
#include "voice/voice_types.hpp"
#include "voice/worker_pool.hpp"

namespace Voice {

/// AudioCaptureController
/// Owns the microphone for the length of one Recording phase. The capture
/// loop runs on the capture pool and is the only writer of the PCM buffer;
/// the buffer is handed out only after stop() has waited for the loop.
class AudioCaptureController {
public:
    AudioCaptureController(CaptureDeviceFactory makeDevice,
                           WorkerPool& capturePool,
                           unsigned chunkMs = 100,
                           std::chrono::milliseconds stopTimeout = std::chrono::milliseconds(1000));
    ~AudioCaptureController();

    AudioCaptureController(const AudioCaptureController&) = delete;
    AudioCaptureController& operator=(const AudioCaptureController&) = delete;

    /// Open the microphone and start the capture loop. Non-blocking.
    /// Returns DeviceInitFailure if the device fails or is already owned.
    VoiceError start(const AudioFormat& format);

    /// Stop the loop, close the device and hand back everything captured.
    /// nullopt when no capture was active.
    std::optional<PcmBuffer> stop();

    bool isCapturing() const { return capturing_.load(); }
    std::size_t chunkBytes() const { return chunkBytes_; }

private:
    void captureLoop();
    void releaseDevice();

    CaptureDeviceFactory makeDevice_;
    WorkerPool& pool_;
    unsigned chunkMs_;
    std::chrono::milliseconds stopTimeout_;

    std::atomic<bool> capturing_{false};   // microphone exclusivity
    std::atomic<bool> running_{false};     // loop keep-going signal

    std::unique_ptr<CaptureDevice> device_;
    std::size_t chunkBytes_ = 0;
    PcmBuffer buffer_;                     // written by the loop only
    std::future<void> loopDone_;
};

} // namespace Voice

#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "voice/voice_types.hpp"

namespace Voice {

// ------------------------------------------------------------
// Microphone
// ------------------------------------------------------------
class CaptureDevice {
public:
    virtual ~CaptureDevice() = default;

    /// Open and start the input stream. bufferBytes is the size of one read.
    virtual bool open(const AudioFormat& format, std::size_t bufferBytes) = 0;

    /// Blocking read of up to `bytes`. Returns bytes read (0 allowed),
    /// or -1 on a device error.
    virtual long read(std::uint8_t* dst, std::size_t bytes) = 0;

    /// Unblock a pending read from another thread.
    virtual void abort() = 0;

    virtual void close() = 0;
};

// ------------------------------------------------------------
// Output device
// ------------------------------------------------------------
class PlaybackDevice {
public:
    virtual ~PlaybackDevice() = default;

    virtual bool open(const AudioFormat& format, std::size_t bufferBytes) = 0;

    /// Blocks until the whole range has been played.
    /// Throws std::runtime_error when the device rejects the data.
    virtual void write(const std::uint8_t* data, std::size_t bytes) = 0;

    virtual void close() = 0;
};

using CaptureDeviceFactory  = std::function<std::unique_ptr<CaptureDevice>()>;
using PlaybackDeviceFactory = std::function<std::unique_ptr<PlaybackDevice>()>;

// PortAudio blocking-read input stream (deviceIndex < 0 -> default input)
std::unique_ptr<CaptureDevice> makePortAudioCaptureDevice(int deviceIndex);

// SFML sound buffer playback
std::unique_ptr<PlaybackDevice> makeSfmlPlaybackDevice();

// ------------------------------------------------------------
// Device listing
// ------------------------------------------------------------
struct AudioDeviceInfo {
    int index = -1;
    std::string name;
    std::string hostApi;
    int maxInputChannels = 0;
    int maxOutputChannels = 0;
    double defaultSampleRate = 0.0;
    bool isDefaultInput = false;
    bool isDefaultOutput = false;
};

std::vector<AudioDeviceInfo> listAudioDevices();

} // namespace Voice

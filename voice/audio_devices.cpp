#include "voice/audio_devices.hpp"
#include "logger.hpp"

#include <portaudio.h>
#include <SFML/Audio.hpp>
#include <SFML/System/Sleep.hpp>
#include <SFML/System/Time.hpp>

#include <atomic>
#include <cstring>
#include <stdexcept>

namespace Voice {

// ============================================================
// PortAudio capture
// ============================================================
namespace {

class PortAudioCaptureDevice : public CaptureDevice {
public:
    explicit PortAudioCaptureDevice(int deviceIndex)
        : requestedIndex_(deviceIndex) {}

    ~PortAudioCaptureDevice() override {
        close();
    }

    bool open(const AudioFormat& format, std::size_t bufferBytes) override {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            LOG_ERROR("Audio/Capture", std::string("Pa_Initialize failed: ") + Pa_GetErrorText(err));
            return false;
        }
        initialized_ = true;

        int deviceIndex = (requestedIndex_ >= 0) ? requestedIndex_ : Pa_GetDefaultInputDevice();
        if (deviceIndex == paNoDevice || deviceIndex < 0 || deviceIndex >= Pa_GetDeviceCount()) {
            LOG_ERROR("Audio/Capture", "No valid input device (index=" + std::to_string(deviceIndex) + ")");
            close();
            return false;
        }

        const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(deviceIndex);
        LOG_DEBUG("Audio/Capture", std::string("Using input device: ") + devInfo->name);

        format_ = format;
        unsigned long framesPerBuffer = static_cast<unsigned long>(bufferBytes / format.bytesPerFrame());

        PaStreamParameters inputParams;
        inputParams.device = deviceIndex;
        inputParams.channelCount = static_cast<int>(format.channelCount());
        inputParams.sampleFormat = paInt16;
        inputParams.suggestedLatency = devInfo->defaultLowInputLatency;
        inputParams.hostApiSpecificStreamInfo = nullptr;

        // No callback: blocking Pa_ReadStream
        err = Pa_OpenStream(&stream_, &inputParams, nullptr,
                            format.sampleRate, framesPerBuffer,
                            paClipOff, nullptr, nullptr);
        if (err != paNoError || !stream_) {
            LOG_ERROR("Audio/Capture", std::string("Could not open mic stream: ") + Pa_GetErrorText(err));
            stream_ = nullptr;
            close();
            return false;
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            LOG_ERROR("Audio/Capture", std::string("Could not start mic stream: ") + Pa_GetErrorText(err));
            close();
            return false;
        }

        aborted_ = false;
        return true;
    }

    long read(std::uint8_t* dst, std::size_t bytes) override {
        if (!stream_ || aborted_) return -1;

        unsigned long frames = static_cast<unsigned long>(bytes / format_.bytesPerFrame());
        PaError err = Pa_ReadStream(stream_, dst, frames);
        if (err == paInputOverflowed) {
            LOG_WARN("Audio/Capture", "Input overflowed, samples were dropped");
        } else if (err != paNoError) {
            if (!aborted_) {
                LOG_ERROR("Audio/Capture", std::string("Pa_ReadStream failed: ") + Pa_GetErrorText(err));
            }
            return -1;
        }
        return static_cast<long>(frames * format_.bytesPerFrame());
    }

    void abort() override {
        aborted_ = true;
        if (stream_) {
            Pa_AbortStream(stream_);
        }
    }

    void close() override {
        if (stream_) {
            if (!aborted_) Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
        if (initialized_) {
            Pa_Terminate();
            initialized_ = false;
        }
    }

private:
    int requestedIndex_;
    AudioFormat format_;
    PaStream* stream_ = nullptr;
    bool initialized_ = false;
    std::atomic<bool> aborted_{false};
};

// ============================================================
// SFML playback
// ============================================================
class SfmlPlaybackDevice : public PlaybackDevice {
public:
    bool open(const AudioFormat& format, std::size_t bufferBytes) override {
        format_ = format;
        bufferBytes_ = bufferBytes;
        opened_ = true;
        LOG_DEBUG("Audio/Playback", "Output opened at " + std::to_string(format.sampleRate) +
                                    " Hz, min buffer " + std::to_string(bufferBytes) + " bytes");
        return true;
    }

    void write(const std::uint8_t* data, std::size_t bytes) override {
        if (!opened_) {
            throw std::runtime_error("output device not open");
        }

        std::size_t sampleCount = bytes / format_.bytesPerSample();
        std::vector<std::int16_t> samples(sampleCount);
        std::memcpy(samples.data(), data, sampleCount * sizeof(std::int16_t));

        std::vector<sf::SoundChannel> channelMap =
            (format_.channelCount() == 2)
                ? std::vector<sf::SoundChannel>{sf::SoundChannel::FrontLeft, sf::SoundChannel::FrontRight}
                : std::vector<sf::SoundChannel>{sf::SoundChannel::Mono};

        sf::SoundBuffer buffer;
        if (!buffer.loadFromSamples(samples.data(), samples.size(),
                                    format_.channelCount(), format_.sampleRate, channelMap)) {
            throw std::runtime_error("SoundBuffer rejected " + std::to_string(bytes) + " bytes of PCM");
        }

        sf::Sound sound(buffer);
        sound.setVolume(100.f);
        sound.play();

        LOG_DEBUG("Audio/Playback", "Playing " + std::to_string(bytes) + " bytes (duration=" +
                                    std::to_string(buffer.getDuration().asSeconds()) + "s)");

        while (sound.getStatus() == sf::Sound::Status::Playing) {
            sf::sleep(sf::milliseconds(10));
        }
    }

    void close() override {
        opened_ = false;
    }

private:
    AudioFormat format_;
    std::size_t bufferBytes_ = 0;
    bool opened_ = false;
};

} // namespace

std::unique_ptr<CaptureDevice> makePortAudioCaptureDevice(int deviceIndex) {
    return std::make_unique<PortAudioCaptureDevice>(deviceIndex);
}

std::unique_ptr<PlaybackDevice> makeSfmlPlaybackDevice() {
    return std::make_unique<SfmlPlaybackDevice>();
}

// ============================================================
// Device listing
// ============================================================
std::vector<AudioDeviceInfo> listAudioDevices() {
    std::vector<AudioDeviceInfo> devices;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        LOG_ERROR("Audio/Devices", std::string("PortAudio error: ") + Pa_GetErrorText(err));
        return devices;
    }

    int numDevices = Pa_GetDeviceCount();
    if (numDevices < 0) {
        LOG_ERROR("Audio/Devices", "Pa_GetDeviceCount returned " + std::to_string(numDevices));
        Pa_Terminate();
        return devices;
    }

    int defaultIn = Pa_GetDefaultInputDevice();
    int defaultOut = Pa_GetDefaultOutputDevice();

    for (int i = 0; i < numDevices; i++) {
        const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(i);
        if (!deviceInfo) continue;

        const PaHostApiInfo* hostApiInfo = Pa_GetHostApiInfo(deviceInfo->hostApi);

        AudioDeviceInfo info;
        info.index = i;
        info.name = deviceInfo->name;
        info.hostApi = hostApiInfo ? hostApiInfo->name : "";
        info.maxInputChannels = deviceInfo->maxInputChannels;
        info.maxOutputChannels = deviceInfo->maxOutputChannels;
        info.defaultSampleRate = deviceInfo->defaultSampleRate;
        info.isDefaultInput = (i == defaultIn);
        info.isDefaultOutput = (i == defaultOut);
        devices.push_back(std::move(info));
    }

    Pa_Terminate();
    return devices;
}

} // namespace Voice

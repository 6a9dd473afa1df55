#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Voice {

// ------------------------------------------------------------
// Error taxonomy
// ------------------------------------------------------------
enum class VoiceError {
    None,
    PermissionDenied,
    DeviceInitFailure,
    NoAudioRecorded,
    NetworkFailure,
    ServiceError,
    NoSpeech,
    ParseFailure,
    PlaybackBusy,
    DeviceWriteFailure,
    SessionBusy,          // start requested while a transcription is in flight
    NoAssistantMessage    // speak requested before any assistant reply exists
};

// Stable code used as key in errors.json ("ERR_VOICE_...")
const char* errorCode(VoiceError error);
const char* errorName(VoiceError error);

// ------------------------------------------------------------
// Audio format
// ------------------------------------------------------------
enum class ChannelLayout { Mono, Stereo };
enum class SampleEncoding { Pcm16 };

struct AudioFormat {
    unsigned sampleRate = 16000;
    ChannelLayout channels = ChannelLayout::Mono;
    SampleEncoding encoding = SampleEncoding::Pcm16;

    unsigned channelCount() const { return channels == ChannelLayout::Stereo ? 2u : 1u; }
    unsigned bytesPerSample() const { return 2u; }
    unsigned bytesPerFrame() const { return channelCount() * bytesPerSample(); }
    std::size_t bytesPerSecond() const {
        return static_cast<std::size_t>(sampleRate) * bytesPerFrame();
    }
};

// Smallest device buffer holding `chunkMs` of audio, rounded to whole frames.
// Never smaller than 256 frames.
std::size_t minBufferBytes(const AudioFormat& format, unsigned chunkMs);

// ------------------------------------------------------------
// Capture session
// ------------------------------------------------------------
enum class SessionState { Idle, Recording, Transcribing };
const char* sessionStateName(SessionState state);

using SessionId = std::uint64_t;
using PcmBuffer = std::vector<std::uint8_t>;

// Metadata of the one process-wide capture session. The PCM bytes themselves
// live in the capture loop while Recording and in the transcription request
// while Transcribing.
struct AudioSession {
    SessionId id = 0;
    SessionState state = SessionState::Idle;
    AudioFormat format;
    std::size_t bufferBytes = 0;
    std::chrono::system_clock::time_point startedAt{};
};

// ------------------------------------------------------------
// Results
// ------------------------------------------------------------
struct TranscriptResult {
    enum class Outcome { Ready, NoSpeech, Failed };

    Outcome outcome = Outcome::Failed;
    std::string text;
    VoiceError reason = VoiceError::None;
    int serviceCode = 0;

    static TranscriptResult ready(std::string text);
    static TranscriptResult noSpeech();
    static TranscriptResult failed(VoiceError reason, int serviceCode = 0);
};

struct SynthesisRequest {
    std::string text;
    std::string voiceLocale = "en-US";
    std::string voiceName = "en-US-Neural2-F";
    std::string ssmlGender = "FEMALE";
    std::string audioEncoding = "LINEAR16";
    unsigned sampleRate = 22050;
};

struct SynthesisResult {
    enum class Outcome { Ready, Failed };

    Outcome outcome = Outcome::Failed;
    PcmBuffer audio;
    unsigned sampleRate = 0;
    VoiceError reason = VoiceError::None;
    int serviceCode = 0;

    static SynthesisResult ready(PcmBuffer audio, unsigned sampleRate);
    static SynthesisResult failed(VoiceError reason, int serviceCode = 0);
};

// ------------------------------------------------------------
// User-visible notice (transient, one per reported condition)
// ------------------------------------------------------------
struct Notice {
    VoiceError error = VoiceError::None;  // None for informational and non-voice notices
    std::string code;                     // "ERR_..." for errors, response key otherwise
    std::string message;
    int serviceCode = 0;

    bool isError() const { return code.rfind("ERR_", 0) == 0; }
};

} // namespace Voice

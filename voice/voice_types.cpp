#include "voice/voice_types.hpp"

#include <algorithm>
#include <utility>

namespace Voice {

const char* errorCode(VoiceError error) {
    switch (error) {
        case VoiceError::None:               return "ERR_NONE";
        case VoiceError::PermissionDenied:   return "ERR_VOICE_PERMISSION_DENIED";
        case VoiceError::DeviceInitFailure:  return "ERR_VOICE_DEVICE_INIT";
        case VoiceError::NoAudioRecorded:    return "ERR_VOICE_NO_AUDIO";
        case VoiceError::NetworkFailure:     return "ERR_VOICE_NETWORK";
        case VoiceError::ServiceError:       return "ERR_VOICE_SERVICE";
        case VoiceError::NoSpeech:           return "ERR_VOICE_NO_SPEECH";
        case VoiceError::ParseFailure:       return "ERR_VOICE_PARSE";
        case VoiceError::PlaybackBusy:       return "ERR_VOICE_PLAYBACK_BUSY";
        case VoiceError::DeviceWriteFailure: return "ERR_VOICE_DEVICE_WRITE";
        case VoiceError::SessionBusy:        return "ERR_VOICE_SESSION_BUSY";
        case VoiceError::NoAssistantMessage: return "ERR_VOICE_NO_REPLY";
    }
    return "ERR_UNKNOWN";
}

const char* errorName(VoiceError error) {
    switch (error) {
        case VoiceError::None:               return "None";
        case VoiceError::PermissionDenied:   return "PermissionDenied";
        case VoiceError::DeviceInitFailure:  return "DeviceInitFailure";
        case VoiceError::NoAudioRecorded:    return "NoAudioRecorded";
        case VoiceError::NetworkFailure:     return "NetworkFailure";
        case VoiceError::ServiceError:       return "ServiceError";
        case VoiceError::NoSpeech:           return "NoSpeech";
        case VoiceError::ParseFailure:       return "ParseFailure";
        case VoiceError::PlaybackBusy:       return "PlaybackBusy";
        case VoiceError::DeviceWriteFailure: return "DeviceWriteFailure";
        case VoiceError::SessionBusy:        return "SessionBusy";
        case VoiceError::NoAssistantMessage: return "NoAssistantMessage";
    }
    return "Unknown";
}

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Idle:         return "Idle";
        case SessionState::Recording:    return "Recording";
        case SessionState::Transcribing: return "Transcribing";
    }
    return "Invalid";
}

std::size_t minBufferBytes(const AudioFormat& format, unsigned chunkMs) {
    constexpr std::size_t kMinFrames = 256;

    std::size_t frames = static_cast<std::size_t>(format.sampleRate) * chunkMs / 1000;
    frames = std::max(frames, kMinFrames);
    return frames * format.bytesPerFrame();
}

TranscriptResult TranscriptResult::ready(std::string text) {
    TranscriptResult r;
    r.outcome = Outcome::Ready;
    r.text = std::move(text);
    return r;
}

TranscriptResult TranscriptResult::noSpeech() {
    TranscriptResult r;
    r.outcome = Outcome::NoSpeech;
    r.reason = VoiceError::NoSpeech;
    return r;
}

TranscriptResult TranscriptResult::failed(VoiceError reason, int serviceCode) {
    TranscriptResult r;
    r.outcome = Outcome::Failed;
    r.reason = reason;
    r.serviceCode = serviceCode;
    return r;
}

SynthesisResult SynthesisResult::ready(PcmBuffer audio, unsigned sampleRate) {
    SynthesisResult r;
    r.outcome = Outcome::Ready;
    r.audio = std::move(audio);
    r.sampleRate = sampleRate;
    return r;
}

SynthesisResult SynthesisResult::failed(VoiceError reason, int serviceCode) {
    SynthesisResult r;
    r.outcome = Outcome::Failed;
    r.reason = reason;
    r.serviceCode = serviceCode;
    return r;
}

} // namespace Voice

#pragma once
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "chat/chat_bridge.hpp"
#include "voice/audio_capture.hpp"
#include "voice/event_loop.hpp"
#include "voice/permission_gate.hpp"
#include "voice/transcription_client.hpp"
#include "voice/voice_types.hpp"

namespace Voice {

struct VoiceSessionSettings {
    AudioFormat format;                 // 16 kHz mono PCM16 by default
    std::string languageCode = "en-US";
};

/// VoiceSessionStateMachine
/// Idle -> Recording -> Transcribing -> Idle, driven by user gestures.
///
/// Requests may be made from any thread; they are posted to the event loop
/// and every mutation, result delivery and listener call happens there.
/// Results that come back for a session that is no longer current are
/// dropped.
///
/// @example
///   machine.addNoticeListener([](const Notice& n) { std::cout << n.message; });
///   machine.requestToggle();   // start recording
///   machine.requestToggle();   // stop, transcribe, forward to chat
class VoiceSessionStateMachine {
public:
    using StateCallback  = std::function<void(SessionState, SessionState)>;
    using NoticeCallback = std::function<void(const Notice&)>;

    VoiceSessionStateMachine(EventLoop& loop,
                             AudioCaptureController& capture,
                             TranscriptionClient& transcriber,
                             Chat::ChatSessionBridge& chat,
                             const PermissionGate& permissions,
                             VoiceSessionSettings settings = {});
    ~VoiceSessionStateMachine();

    VoiceSessionStateMachine(const VoiceSessionStateMachine&) = delete;
    VoiceSessionStateMachine& operator=(const VoiceSessionStateMachine&) = delete;

    // Gestures
    void requestToggle();
    void requestStart();
    void requestStop();

    SessionState state() const { return state_.load(); }
    SessionId currentSessionId() const { return sessionId_.load(); }
    AudioSession sessionSnapshot() const;

    int addStateChangeListener(StateCallback callback);
    void removeStateChangeListener(int listenerId);
    int addNoticeListener(NoticeCallback callback);
    void removeNoticeListener(int listenerId);

    /// Discard any recording, invalidate in-flight results, return to Idle.
    /// Later requests are ignored. Blocks until done unless called on the loop.
    void shutdown();

    static bool isValidTransition(SessionState from, SessionState to);

private:
    void post(const char* what, std::function<void()> task);

    void handleStart();
    void handleStop();
    void onTranscript(SessionId session, const TranscriptResult& result);
    void abandonSession();

    bool transition(SessionState from, SessionState to);
    void notify(const Notice& notice);

    EventLoop& loop_;
    AudioCaptureController& capture_;
    TranscriptionClient& transcriber_;
    Chat::ChatSessionBridge& chat_;
    const PermissionGate& permissions_;
    VoiceSessionSettings settings_;

    std::atomic<SessionState> state_{SessionState::Idle};
    std::atomic<SessionId> sessionId_{0};
    std::atomic<bool> stopping_{false};

    mutable std::mutex sessionMutex_;
    AudioSession session_;

    std::mutex listenerMutex_;
    int nextListenerId_ = 0;
    std::vector<std::pair<int, StateCallback>> stateListeners_;
    std::vector<std::pair<int, NoticeCallback>> noticeListeners_;
};

} // namespace Voice

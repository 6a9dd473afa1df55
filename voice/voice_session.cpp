#include "voice/voice_session.hpp"
#include "error_manager.hpp"
#include "response_manager.hpp"
#include "logger.hpp"

#include <algorithm>

namespace Voice {

VoiceSessionStateMachine::VoiceSessionStateMachine(EventLoop& loop,
                                                   AudioCaptureController& capture,
                                                   TranscriptionClient& transcriber,
                                                   Chat::ChatSessionBridge& chat,
                                                   const PermissionGate& permissions,
                                                   VoiceSessionSettings settings)
    : loop_(loop),
      capture_(capture),
      transcriber_(transcriber),
      chat_(chat),
      permissions_(permissions),
      settings_(std::move(settings)) {
    session_.format = settings_.format;
}

VoiceSessionStateMachine::~VoiceSessionStateMachine() {
    shutdown();
}

// ============================================================
// Gestures (any thread)
// ============================================================
void VoiceSessionStateMachine::post(const char* what, std::function<void()> task) {
    if (stopping_.load()) {
        LOG_DEBUG("Session", std::string(what) + " ignored, session machine shut down");
        return;
    }
    if (!loop_.post(std::move(task))) {
        LOG_WARN("Session", std::string(what) + " dropped, event loop closed");
    }
}

void VoiceSessionStateMachine::requestToggle() {
    post("toggle", [this]() {
        if (state_.load() == SessionState::Recording) {
            handleStop();
        } else {
            handleStart();
        }
    });
}

void VoiceSessionStateMachine::requestStart() {
    post("start", [this]() { handleStart(); });
}

void VoiceSessionStateMachine::requestStop() {
    post("stop", [this]() { handleStop(); });
}

// ============================================================
// Handlers (loop thread)
// ============================================================
void VoiceSessionStateMachine::handleStart() {
    if (stopping_.load()) return;

    switch (state_.load()) {
        case SessionState::Recording:
            // Second tap on the mic button
            handleStop();
            return;

        case SessionState::Transcribing:
            notify(ErrorManager::report(VoiceError::SessionBusy,
                                        "session " + std::to_string(sessionId_.load())));
            return;

        case SessionState::Idle:
            break;
    }

    if (!permissions_.hasMicrophonePermission()) {
        notify(ErrorManager::report(VoiceError::PermissionDenied));
        return;
    }

    VoiceError err = capture_.start(settings_.format);
    if (err != VoiceError::None) {
        notify(ErrorManager::report(err));
        return;
    }

    SessionId id = sessionId_.fetch_add(1) + 1;
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        session_.id = id;
        session_.format = settings_.format;
        session_.bufferBytes = 0;
        session_.startedAt = std::chrono::system_clock::now();
    }

    if (!transition(SessionState::Idle, SessionState::Recording)) {
        // Only reachable if shutdown raced us; give the microphone back
        auto discarded = capture_.stop();
        LOG_WARN("Session", "Session " + std::to_string(id) + " abandoned at start (" +
                            std::to_string(discarded ? discarded->size() : 0) + " bytes)");
        return;
    }

    LOG_PHASE("Voice session " + std::to_string(id) + " recording", true);
    notify(ResponseManager::info("voice_start"));
}

void VoiceSessionStateMachine::handleStop() {
    switch (state_.load()) {
        case SessionState::Transcribing:
            notify(ErrorManager::report(VoiceError::SessionBusy,
                                        "session " + std::to_string(sessionId_.load())));
            return;

        case SessionState::Idle:
            LOG_DEBUG("Session", "stop ignored while Idle");
            return;

        case SessionState::Recording:
            break;
    }

    SessionId id = sessionId_.load();
    auto pcm = capture_.stop();
    std::size_t bytes = pcm ? pcm->size() : 0;

    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        session_.bufferBytes = bytes;
    }

    if (bytes == 0) {
        transition(SessionState::Recording, SessionState::Idle);
        LOG_PHASE("Voice session " + std::to_string(id) + " empty", false);
        notify(ErrorManager::report(VoiceError::NoAudioRecorded, "session " + std::to_string(id)));
        return;
    }

    transition(SessionState::Recording, SessionState::Transcribing);
    notify(ResponseManager::info("voice_processing"));

    bool queued = transcriber_.transcribe(
        id, std::move(*pcm), settings_.format.sampleRate, settings_.languageCode,
        [this](SessionId session, TranscriptResult result) { onTranscript(session, result); });
    if (!queued) {
        LOG_WARN("Session", "Session " + std::to_string(id) + " transcription was not queued");
    }
}

void VoiceSessionStateMachine::onTranscript(SessionId session, const TranscriptResult& result) {
    if (session != sessionId_.load() || state_.load() != SessionState::Transcribing) {
        LOG_DEBUG("Session", "Stale transcription for session " + std::to_string(session) +
                             " discarded (current " + std::to_string(sessionId_.load()) + ", " +
                             sessionStateName(state_.load()) + ")");
        return;
    }

    transition(SessionState::Transcribing, SessionState::Idle);

    switch (result.outcome) {
        case TranscriptResult::Outcome::Ready:
            LOG_PHASE("Voice session " + std::to_string(session) + " transcribed", true);
            chat_.submit(result.text);
            notify(ResponseManager::info("voice_sent", result.text));
            break;

        case TranscriptResult::Outcome::NoSpeech:
            notify(ErrorManager::report(VoiceError::NoSpeech, "session " + std::to_string(session)));
            break;

        case TranscriptResult::Outcome::Failed:
            LOG_PHASE("Voice session " + std::to_string(session) + " transcribed", false);
            notify(ErrorManager::report(result.reason, "session " + std::to_string(session),
                                        result.serviceCode));
            break;
    }
}

// ============================================================
// Shutdown
// ============================================================
void VoiceSessionStateMachine::abandonSession() {
    SessionState current = state_.load();

    if (current == SessionState::Recording) {
        auto discarded = capture_.stop();
        LOG_DEBUG("Session", "Recording discarded at shutdown (" +
                             std::to_string(discarded ? discarded->size() : 0) + " bytes)");
    }

    // In-flight transcriptions now carry an old id
    sessionId_.fetch_add(1);

    if (current != SessionState::Idle) {
        transition(current, SessionState::Idle);
    }
}

void VoiceSessionStateMachine::shutdown() {
    if (stopping_.exchange(true)) return;

    LOG_DEBUG("Session", "Shutting down voice session machine");

    if (loop_.isLoopThread()) {
        abandonSession();
    } else if (loop_.post([this]() { abandonSession(); })) {
        loop_.flush();
    } else {
        // Loop already gone: nothing else can touch the state now
        abandonSession();
    }
}

// ============================================================
// Transitions + listeners
// ============================================================
bool VoiceSessionStateMachine::isValidTransition(SessionState from, SessionState to) {
    switch (from) {
        case SessionState::Idle:
            return to == SessionState::Recording;
        case SessionState::Recording:
            return to == SessionState::Transcribing || to == SessionState::Idle;
        case SessionState::Transcribing:
            return to == SessionState::Idle;
    }
    return false;
}

bool VoiceSessionStateMachine::transition(SessionState from, SessionState to) {
    if (!isValidTransition(from, to)) {
        LOG_WARN("Session", std::string("Invalid transition: ") +
                            sessionStateName(from) + " -> " + sessionStateName(to));
        return false;
    }

    SessionState expected = from;
    if (!state_.compare_exchange_strong(expected, to)) {
        LOG_WARN("Session", std::string("Transition ") + sessionStateName(from) + " -> " +
                            sessionStateName(to) + " lost, state is " + sessionStateName(expected));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        session_.state = to;
    }
    LOG_DEBUG("Session", std::string("State transition: ") +
                         sessionStateName(from) + " -> " + sessionStateName(to));

    std::vector<std::pair<int, StateCallback>> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners = stateListeners_;
    }
    for (const auto& [id, callback] : listeners) {
        if (callback) callback(from, to);
    }
    return true;
}

void VoiceSessionStateMachine::notify(const Notice& notice) {
    LOG_TRACE("Session", "Notice " + notice.code + ": " + notice.message);

    std::vector<std::pair<int, NoticeCallback>> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners = noticeListeners_;
    }
    for (const auto& [id, callback] : listeners) {
        if (callback) callback(notice);
    }
}

AudioSession VoiceSessionStateMachine::sessionSnapshot() const {
    std::lock_guard<std::mutex> lock(sessionMutex_);
    return session_;
}

int VoiceSessionStateMachine::addStateChangeListener(StateCallback callback) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    int id = nextListenerId_++;
    stateListeners_.emplace_back(id, std::move(callback));
    return id;
}

void VoiceSessionStateMachine::removeStateChangeListener(int listenerId) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    stateListeners_.erase(
        std::remove_if(stateListeners_.begin(), stateListeners_.end(),
                       [listenerId](const auto& entry) { return entry.first == listenerId; }),
        stateListeners_.end());
}

int VoiceSessionStateMachine::addNoticeListener(NoticeCallback callback) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    int id = nextListenerId_++;
    noticeListeners_.emplace_back(id, std::move(callback));
    return id;
}

void VoiceSessionStateMachine::removeNoticeListener(int listenerId) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    noticeListeners_.erase(
        std::remove_if(noticeListeners_.begin(), noticeListeners_.end(),
                       [listenerId](const auto& entry) { return entry.first == listenerId; }),
        noticeListeners_.end());
}

} // namespace Voice

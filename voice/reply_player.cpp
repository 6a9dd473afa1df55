#include "voice/reply_player.hpp"
#include "error_manager.hpp"
#include "response_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>

namespace Voice {

ReplyPlayer::ReplyPlayer(EventLoop& loop,
                         SpeechSynthesisClient& synthesizer,
                         AudioPlaybackController& playback,
                         const Chat::ChatSessionBridge& chat,
                         SynthesisRequest voice)
    : loop_(loop),
      synthesizer_(synthesizer),
      playback_(playback),
      chat_(chat),
      voice_(std::move(voice)) {}

ReplyPlayer::~ReplyPlayer() {
    shutdown();
}

void ReplyPlayer::post(const char* what, std::function<void()> task) {
    if (stopping_.load()) {
        LOG_DEBUG("Reply", std::string(what) + " ignored, reply player shut down");
        return;
    }
    if (!loop_.post(std::move(task))) {
        LOG_WARN("Reply", std::string(what) + " dropped, event loop closed");
    }
}

void ReplyPlayer::speak(const std::string& text) {
    post("speak", [this, text]() { handleSpeak(text); });
}

void ReplyPlayer::speakLatestReply() {
    post("speak latest", [this]() {
        auto reply = chat_.latestAssistantMessage();
        if (!reply) {
            notify(ErrorManager::report(VoiceError::NoAssistantMessage));
            return;
        }
        handleSpeak(*reply);
    });
}

// ============================================================
// Pipeline (loop thread)
// ============================================================
void ReplyPlayer::handleSpeak(const std::string& text) {
    if (stopping_.load()) return;

    bool blank = std::all_of(text.begin(), text.end(),
                             [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        notify(ErrorManager::report(VoiceError::NoAssistantMessage, "empty text"));
        return;
    }

    if (playback_.isActive()) {
        notify(ErrorManager::report(VoiceError::PlaybackBusy));
        return;
    }

    SynthesisRequest request = voice_;
    request.text = text;

    notify(ResponseManager::info("tts_converting"));

    std::uint64_t gen = generation_.load();
    bool queued = synthesizer_.synthesize(request, [this, gen](SynthesisResult result) {
        onSynthesized(gen, result);
    });
    if (!queued) {
        LOG_WARN("Reply", "Synthesis request was not queued");
    }
}

void ReplyPlayer::onSynthesized(std::uint64_t gen, const SynthesisResult& result) {
    if (gen != generation_.load()) {
        LOG_DEBUG("Reply", "Stale synthesis result (generation " + std::to_string(gen) + ") discarded");
        return;
    }

    if (result.outcome == SynthesisResult::Outcome::Failed) {
        notify(ErrorManager::report(result.reason, "synthesis", result.serviceCode));
        return;
    }

    VoiceError err = playback_.play(result.audio, result.sampleRate, [this, gen](VoiceError done) {
        // Playback thread: hop back to the loop
        if (!loop_.post([this, gen, done]() { onPlaybackDone(gen, done); })) {
            LOG_WARN("Reply", "Playback result dropped, event loop closed");
        }
    });

    if (err != VoiceError::None) {
        notify(ErrorManager::report(err));
        return;
    }
    notify(ResponseManager::info("tts_playing"));
}

void ReplyPlayer::onPlaybackDone(std::uint64_t gen, VoiceError result) {
    if (gen != generation_.load()) {
        LOG_DEBUG("Reply", "Playback finished after shutdown");
        return;
    }
    if (result != VoiceError::None) {
        notify(ErrorManager::report(result, "playback"));
        return;
    }
    notify(ResponseManager::info("tts_finished"));
}

// ============================================================
// Listeners / shutdown
// ============================================================
void ReplyPlayer::notify(const Notice& notice) {
    LOG_TRACE("Reply", "Notice " + notice.code + ": " + notice.message);

    std::vector<std::pair<int, NoticeCallback>> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners = listeners_;
    }
    for (const auto& [id, callback] : listeners) {
        if (callback) callback(notice);
    }
}

int ReplyPlayer::addNoticeListener(NoticeCallback callback) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    int id = nextListenerId_++;
    listeners_.emplace_back(id, std::move(callback));
    return id;
}

void ReplyPlayer::shutdown() {
    if (stopping_.exchange(true)) return;
    generation_.fetch_add(1);
    LOG_DEBUG("Reply", "Reply player shut down");
}

} // namespace Voice

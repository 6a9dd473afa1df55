#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "chat/chat_bridge.hpp"
#include "voice/audio_playback.hpp"
#include "voice/event_loop.hpp"
#include "voice/speech_synthesis_client.hpp"
#include "voice/voice_types.hpp"

namespace Voice {

/// ReplyPlayer
/// Reads assistant replies aloud: synthesize on the network pool, then hand
/// the PCM to the playback controller. All decisions run on the event loop.
class ReplyPlayer {
public:
    using NoticeCallback = std::function<void(const Notice&)>;

    // voice carries locale, voice name, gender and rate; its text is ignored
    ReplyPlayer(EventLoop& loop,
                SpeechSynthesisClient& synthesizer,
                AudioPlaybackController& playback,
                const Chat::ChatSessionBridge& chat,
                SynthesisRequest voice = {});
    ~ReplyPlayer();

    ReplyPlayer(const ReplyPlayer&) = delete;
    ReplyPlayer& operator=(const ReplyPlayer&) = delete;

    void speak(const std::string& text);
    void speakLatestReply();

    int addNoticeListener(NoticeCallback callback);

    /// Late synthesis results are dropped after this; later requests ignored.
    void shutdown();

    std::uint64_t generation() const { return generation_.load(); }

private:
    void post(const char* what, std::function<void()> task);
    void handleSpeak(const std::string& text);
    void onSynthesized(std::uint64_t generation, const SynthesisResult& result);
    void onPlaybackDone(std::uint64_t generation, VoiceError result);
    void notify(const Notice& notice);

    EventLoop& loop_;
    SpeechSynthesisClient& synthesizer_;
    AudioPlaybackController& playback_;
    const Chat::ChatSessionBridge& chat_;
    SynthesisRequest voice_;

    std::atomic<std::uint64_t> generation_{0};
    std::atomic<bool> stopping_{false};

    std::mutex listenerMutex_;
    std::vector<std::pair<int, NoticeCallback>> listeners_;
    int nextListenerId_ = 0;
};

} // namespace Voice

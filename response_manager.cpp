#include <mutex>
#include <random>
#include <unordered_map>
#include <vector>
#include "response_manager.hpp"
#include "error_manager.hpp"

// Simple random picker
static std::string pickRandom(const std::vector<std::string>& options) {
    static std::mutex mtx;
    static std::random_device rd;
    static std::mt19937 gen(rd());

    std::lock_guard<std::mutex> lock(mtx);
    std::uniform_int_distribution<> dist(0, static_cast<int>(options.size()) - 1);
    return options[dist(gen)];
}

// Response database
static const std::unordered_map<std::string, std::vector<std::string>> responses = {
    // --- Voice input ---
    { "voice_start", {
        "Listening...",
        "Recording started, go ahead.",
        "I'm listening."
    }},
    { "voice_processing", {
        "Processing voice...",
        "Got it, transcribing now.",
        "One moment, working out what you said."
    }},
    { "voice_sent", {
        "Voice message sent: ",
        "Sent to chat: ",
        "You said: "
    }},
    { "voice_cancelled", {
        "Recording discarded.",
        "Voice input cancelled."
    }},

    // --- Voice output ---
    { "tts_converting", {
        "Converting to speech...",
        "Preparing audio..."
    }},
    { "tts_playing", {
        "Playing audio...",
        "Reading it out now."
    }},
    { "tts_finished", {
        "Audio playback completed.",
        "Done reading."
    }},

    // --- Chat ---
    { "chat_sent", {
        "Message sent.",
        "Asking the assistant..."
    }},
    { "chat_no_backend", {
        "No chat backend configured (chat.backend_url is empty).",
    }},
    { "chat_failed", {
        "The assistant could not be reached: "
    }},

    // --- Console ---
    { "help", {
        "Here are the available commands.",
        "These are the commands you can use."
    }},
    { "mic_permission", {
        "Microphone permission set to ",
    }},

    // --- Startup ---
    { "startup", {
        "WalletVoice is ready.",
        "Voice assistant online."
    }},
};

std::string ResponseManager::get(const std::string& keyOrMessage) {
    auto it = responses.find(keyOrMessage);
    if (it != responses.end() && !it->second.empty()) {
        return pickRandom(it->second);
    }

    // If it already looks like a full message (starts with [ or has newlines), return it as-is
    if (!keyOrMessage.empty() && (keyOrMessage[0] == '[' || keyOrMessage.find('\n') != std::string::npos)) {
        return keyOrMessage;
    }

    // Otherwise, treat as an unknown key and fallback gracefully
    return ErrorManager::getUserMessage("ERR_CORE_UNKNOWN_COMMAND") + " (" + keyOrMessage + ")";
}

Voice::Notice ResponseManager::info(const std::string& key, const std::string& suffix) {
    Voice::Notice notice;
    notice.code    = key;
    notice.message = get(key) + suffix;
    return notice;
}

#include "commands_interface.hpp"
#include "bootstrap.hpp"
#include "response_manager.hpp"
#include "error_manager.hpp"

#include <sstream>
#include <string>

// ------------------------------------------------------------
// [Chat] Typed message, same path as a transcript
// ------------------------------------------------------------
CommandResult cmdChat(const std::string& arg) {
    if (!g_runtime) return fromNotice(ErrorManager::report("ERR_CORE_NOT_READY"));
    if (arg.empty()) {
        return fromNotice(ErrorManager::report("ERR_CORE_MISSING_ARGUMENT", "chat"));
    }

    g_runtime->chat->submit(arg);
    return asyncAccepted(ResponseManager::get("chat_sent"));
}

// ------------------------------------------------------------
// [Chat] Print conversation
// ------------------------------------------------------------
CommandResult cmdHistory([[maybe_unused]] const std::string& arg) {
    if (!g_runtime) return fromNotice(ErrorManager::report("ERR_CORE_NOT_READY"));

    auto entries = g_runtime->history->entries();
    if (entries.empty()) {
        return { "[History] No messages yet.", true, "ERR_NONE", "routine" };
    }

    std::ostringstream out;
    out << "[History]\n";
    for (const auto& e : entries) {
        out << "  " << Chat::roleName(e.role) << ": " << e.text;
        if (!e.walletLink.empty()) out << "  <" << e.walletLink << ">";
        out << "\n";
    }
    return { out.str(), true, "ERR_NONE", "summary" };
}

// ------------------------------------------------------------
// [Utility] Session + playback state
// ------------------------------------------------------------
CommandResult cmdStatus([[maybe_unused]] const std::string& arg) {
    if (!g_runtime) return fromNotice(ErrorManager::report("ERR_CORE_NOT_READY"));

    auto session = g_runtime->session->sessionSnapshot();

    std::ostringstream out;
    out << "[Status]\n"
        << "  capture:    " << Voice::sessionStateName(g_runtime->session->state())
        << " (session " << g_runtime->session->currentSessionId() << ")\n"
        << "  last take:  " << session.bufferBytes << " bytes at "
        << session.format.sampleRate << " Hz\n"
        << "  playback:   " << (g_runtime->playback->isActive() ? "playing" : "idle")
        << " (" << g_runtime->playback->completedPlaybacks() << " completed)\n"
        << "  microphone: " << (g_runtime->permissions->hasMicrophonePermission() ? "allowed" : "denied") << "\n"
        << "  network:    " << g_runtime->networkPool->pending() << " queued request(s)\n";
    return { out.str(), true, "ERR_NONE", "summary" };
}

// ------------------------------------------------------------
// [Utility] Show help text
// ------------------------------------------------------------
CommandResult cmdShowHelp([[maybe_unused]] const std::string& arg) {
    std::string helpText =
        "[Help] Available commands:\n"
        "- voice                  toggle the microphone\n"
        "- voice_start / voice_stop\n"
        "- say                    read the latest assistant reply aloud\n"
        "- speak <text>           read any text aloud\n"
        "- chat <text>            send a typed message\n"
        "- history\n"
        "- status\n"
        "- devices\n"
        "- mic_permission on|off\n"
        "- help\n"
        "- quit / exit\n";

    return { helpText, true, "ERR_NONE", "summary" };
}

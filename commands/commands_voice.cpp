// ---------------------------------------------------------
// WalletVoice project includes
// ---------------------------------------------------------
#include "commands_voice.hpp"
#include "bootstrap.hpp"
#include "error_manager.hpp"
#include "response_manager.hpp"
#include "voice/audio_devices.hpp"

// ---------------------------------------------------------
// Standard headers
// ---------------------------------------------------------
#include <algorithm>
#include <cctype>
#include <sstream>

// ---------------------------------------------------------
// Internal helpers
// ---------------------------------------------------------
namespace {
    CommandResult notReady() {
        return fromNotice(ErrorManager::report("ERR_CORE_NOT_READY"));
    }

    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
}

// =========================================================
// Microphone
// =========================================================
CommandResult cmdVoice([[maybe_unused]] const std::string& arg) {
    if (!g_runtime) return notReady();
    g_runtime->session->requestToggle();
    return asyncAccepted("[Voice] Toggle requested");
}

CommandResult cmdVoiceStart([[maybe_unused]] const std::string& arg) {
    if (!g_runtime) return notReady();
    g_runtime->session->requestStart();
    return asyncAccepted("[Voice] Start requested");
}

CommandResult cmdVoiceStop([[maybe_unused]] const std::string& arg) {
    if (!g_runtime) return notReady();
    g_runtime->session->requestStop();
    return asyncAccepted("[Voice] Stop requested");
}

CommandResult cmdMicPermission(const std::string& arg) {
    if (!g_runtime) return notReady();

    std::string value = lower(arg);
    if (value == "on" || value == "grant" || value == "true") {
        g_runtime->permissions->setMicrophonePermission(true);
    } else if (value == "off" || value == "revoke" || value == "false") {
        g_runtime->permissions->setMicrophonePermission(false);
    } else if (!value.empty()) {
        return fromNotice(ErrorManager::report("ERR_CORE_MISSING_ARGUMENT", "mic_permission " + arg));
    }

    bool granted = g_runtime->permissions->hasMicrophonePermission();
    return {
        ResponseManager::get("mic_permission") + (granted ? "on" : "off"),
        true,
        "ERR_NONE",
        "routine"
    };
}

CommandResult cmdDevices([[maybe_unused]] const std::string& arg) {
    auto devices = Voice::listAudioDevices();
    if (devices.empty()) {
        return fromNotice(ErrorManager::report(Voice::VoiceError::DeviceInitFailure, "no devices listed"));
    }

    std::ostringstream out;
    out << "[Devices] " << devices.size() << " audio device(s):\n";
    for (const auto& d : devices) {
        out << "  [" << d.index << "] " << d.name
            << " (" << d.hostApi
            << ", in=" << d.maxInputChannels
            << ", out=" << d.maxOutputChannels
            << ", " << static_cast<int>(d.defaultSampleRate) << " Hz)";
        if (d.isDefaultInput)  out << " [default input]";
        if (d.isDefaultOutput) out << " [default output]";
        out << "\n";
    }
    return { out.str(), true, "ERR_NONE", "summary" };
}

// =========================================================
// Speaker
// =========================================================
CommandResult cmdSay([[maybe_unused]] const std::string& arg) {
    if (!g_runtime) return notReady();
    g_runtime->replies->speakLatestReply();
    return asyncAccepted("[Voice] Reading latest reply");
}

CommandResult cmdSpeak(const std::string& arg) {
    if (!g_runtime) return notReady();
    if (arg.empty()) {
        return fromNotice(ErrorManager::report("ERR_CORE_MISSING_ARGUMENT", "speak"));
    }
    g_runtime->replies->speak(arg);
    return asyncAccepted("[Voice] Speaking");
}

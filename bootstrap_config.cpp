#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

namespace bootstrap_config {

// ----------------- helpers -----------------
bool mergeDefaults(nlohmann::json& cfg,
                   const nlohmann::json& defs,
                   const std::string& prefix,
                   int* patchedCount) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        std::string path = prefix.empty() ? key : prefix + "." + key;

        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
            LOG_TRACE("Config", "Added missing key " + path);
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal, path, patchedCount))
                patched = true;
        } else if (defVal.is_number() && cfg[key].is_number()) {
            // integer vs float is not a type mismatch worth resetting
            continue;
        } else if (cfg[key].type() != defVal.type()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
            LOG_TRACE("Config", "Reset mistyped key " + path);
        }
    }
    return patched;
}

// ----------------- defaults -----------------
nlohmann::json defaultVoiceConfig() {
    return {
        {"api_keys", {
            {"google", ""}
        }},

        {"speech", {
            {"recognize_url", "https://speech.googleapis.com/v1/speech:recognize"},
            {"language_code", "en-US"},
            {"sample_rate_hz", 16000},
            {"chunk_ms", 100},
            {"stop_timeout_ms", 1000},
            {"input_device_index", -1},
            {"microphone_permission", true}
        }},

        {"tts", {
            {"synthesize_url", "https://texttospeech.googleapis.com/v1/text:synthesize"},
            {"language_code", "en-US"},
            {"voice_name", "en-US-Neural2-F"},
            {"ssml_gender", "FEMALE"},
            {"sample_rate_hz", 22050}
        }},

        {"network", {
            {"timeout_ms", 30000},
            {"workers", 2}
        }},

        {"chat", {
            {"backend_url", ""}
        }},

        {"logging", {
            {"level", "debug"},
            {"file", "walletvoice.log"}
        }}
    };
}

nlohmann::json defaultErrors() {
    return {
        {"ERR_VOICE_PERMISSION_DENIED", {
            {"user", "[Voice] Microphone permission is required for voice input."},
            {"debug", "hasMicrophonePermission() returned false at start."}
        }},
        {"ERR_VOICE_DEVICE_INIT", {
            {"user", "[Voice] Failed to initialize audio device."},
            {"debug", "Device open failed or the device is already owned."}
        }},
        {"ERR_VOICE_NO_AUDIO", {
            {"user", "[Voice] No audio recorded."},
            {"debug", "Capture stopped with an empty PCM buffer; transcription skipped."}
        }},
        {"ERR_VOICE_NETWORK", {
            {"user", "[Voice] Network error, speech service unreachable."},
            {"debug", "HTTP transport failed (connect, TLS or timeout)."}
        }},
        {"ERR_VOICE_SERVICE", {
            {"user", "[Voice] Speech service returned an error."},
            {"debug", "Recognition or synthesis endpoint answered with a non-2xx status."}
        }},
        {"ERR_VOICE_NO_SPEECH", {
            {"user", "[Voice] No speech detected."},
            {"debug", "Recognition response had no results or an empty transcript."}
        }},
        {"ERR_VOICE_PARSE", {
            {"user", "[Voice] Could not read the speech service response."},
            {"debug", "Body was not JSON, lacked expected fields, or audio was undecodable."}
        }},
        {"ERR_VOICE_PLAYBACK_BUSY", {
            {"user", "[Voice] Already playing audio."},
            {"debug", "play() rejected while the playback flag was held."}
        }},
        {"ERR_VOICE_DEVICE_WRITE", {
            {"user", "[Voice] Error playing audio."},
            {"debug", "Output device threw while writing PCM."}
        }},
        {"ERR_VOICE_SESSION_BUSY", {
            {"user", "[Voice] Still processing the last voice message."},
            {"debug", "start requested while the session is Transcribing."}
        }},
        {"ERR_VOICE_NO_REPLY", {
            {"user", "[Voice] There is no assistant reply to read yet."},
            {"debug", "latestAssistantMessage() was empty or the text was blank."}
        }},
        {"ERR_CONFIG_INVALID", {
            {"user", "[Config] voice_config.json invalid → reset to defaults."},
            {"debug", "voice_config.json failed parsing or validation."}
        }},
        {"ERR_CORE_UNKNOWN_COMMAND", {
            {"user", "[Core] Unknown command. Type 'help' for the list."},
            {"debug", "dispatchCommand found no handler for the input."}
        }},
        {"ERR_CORE_MISSING_ARGUMENT", {
            {"user", "[Core] This command needs an argument."},
            {"debug", "Command called without its required argument."}
        }},
        {"ERR_CORE_NOT_READY", {
            {"user", "[Core] Voice runtime is not running."},
            {"debug", "g_runtime is null; bootstrap failed or already shut down."}
        }},
        {"ERR_CMD_EXCEPTION", {
            {"user", "[Core] The command failed unexpectedly."},
            {"debug", "Command handler threw; see the preceding log line."}
        }}
    };
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);

        LOG_PHASE(name + " created", true);
        return true;
    }

    auto resetToDefaults = [&](const std::string& why) {
        LOG_ERROR("Config", name + " invalid → reset to defaults (" + why + ")");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::report(errorCode, path.string());

        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);
        return false;
    };

    try {
        std::ifstream f(path);
        f >> outConfig;
    } catch (const nlohmann::json::exception& e) {
        return resetToDefaults(e.what());
    }

    if (!outConfig.is_object()) {
        return resetToDefaults("top level is not an object");
    }

    int patchedCount = 0;
    if (mergeDefaults(outConfig, defaults, "", &patchedCount)) {
        std::ofstream(path) << outConfig.dump(2);
        LOG_PHASE(name + " patched", true);
        LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
    } else {
        LOG_PHASE(name + " load", true);
    }
    return true;
}

// ----------------- typed view -----------------
VoiceConfig voiceConfigFromJson(const nlohmann::json& cfg) {
    VoiceConfig out;
    const nlohmann::json defs = defaultVoiceConfig();

    auto section = [&](const char* name) -> nlohmann::json {
        if (cfg.contains(name) && cfg[name].is_object()) return cfg[name];
        return defs[name];
    };
    const auto keys    = section("api_keys");
    const auto speech  = section("speech");
    const auto tts     = section("tts");
    const auto network = section("network");
    const auto chat    = section("chat");
    const auto logging = section("logging");

    auto str = [](const nlohmann::json& s, const char* key, const std::string& def) {
        return (s.contains(key) && s[key].is_string()) ? s[key].get<std::string>() : def;
    };
    auto num = [](const nlohmann::json& s, const char* key, long def) {
        return (s.contains(key) && s[key].is_number()) ? s[key].get<long>() : def;
    };

    out.googleApiKey = str(keys, "google", "");

    out.recognizeUrl   = str(speech, "recognize_url", defs["speech"]["recognize_url"].get<std::string>());
    out.speechLanguage = str(speech, "language_code", "en-US");

    long rate = num(speech, "sample_rate_hz", 16000);
    out.captureFormat.sampleRate = (rate >= 8000 && rate <= 48000) ? static_cast<unsigned>(rate) : 16000u;

    long chunk = num(speech, "chunk_ms", 100);
    out.chunkMs = (chunk >= 10 && chunk <= 1000) ? static_cast<unsigned>(chunk) : 100u;

    long stopTimeout = num(speech, "stop_timeout_ms", 1000);
    out.stopTimeoutMs = stopTimeout > 0 ? static_cast<int>(stopTimeout) : 1000;

    out.inputDeviceIndex = static_cast<int>(num(speech, "input_device_index", -1));
    out.microphonePermission =
        (speech.contains("microphone_permission") && speech["microphone_permission"].is_boolean())
            ? speech["microphone_permission"].get<bool>()
            : true;

    out.synthesizeUrl          = str(tts, "synthesize_url", defs["tts"]["synthesize_url"].get<std::string>());
    out.voice.voiceLocale      = str(tts, "language_code", "en-US");
    out.voice.voiceName        = str(tts, "voice_name", "en-US-Neural2-F");
    out.voice.ssmlGender       = str(tts, "ssml_gender", "FEMALE");
    long ttsRate = num(tts, "sample_rate_hz", 22050);
    out.voice.sampleRate = (ttsRate >= 8000 && ttsRate <= 48000) ? static_cast<unsigned>(ttsRate) : 22050u;

    long timeout = num(network, "timeout_ms", 30000);
    out.networkTimeoutMs = timeout > 0 ? static_cast<int>(timeout) : 30000;

    long workers = num(network, "workers", 2);
    out.networkWorkers = (workers >= 1 && workers <= 8) ? static_cast<unsigned>(workers) : 2u;

    out.chatBackendUrl = str(chat, "backend_url", "");

    out.logLevel = str(logging, "level", "debug");
    out.logFile  = str(logging, "file", "walletvoice.log");

    return out;
}

void applyEnvironment(VoiceConfig& cfg) {
    const char* key = std::getenv("WALLETVOICE_GOOGLE_API_KEY");
    if (key && *key) {
        cfg.googleApiKey = key;
        LOG_DEBUG("Config", "Google API key taken from WALLETVOICE_GOOGLE_API_KEY");
    }
}

// ----------------- entry -----------------
VoiceConfig initAll() {
    // errors.json first so later config problems can be reported
    fs::path errPath = fs::path(getResourcePath()) / ERRORS_FILE;
    nlohmann::json errorsCfg;
    loadConfig(errPath, defaultErrors(), errorsCfg, "Errors config", "");
    ErrorManager::use(errorsCfg);

    // voice_config.json
    fs::path cfgPath = fs::current_path() / VOICE_CONFIG_FILE;
    loadConfig(cfgPath, defaultVoiceConfig(), voiceConfig, "Voice config", "ERR_CONFIG_INVALID");

    VoiceConfig cfg = voiceConfigFromJson(voiceConfig);
    applyEnvironment(cfg);

    if (cfg.googleApiKey.empty()) {
        LOG_WARN("Config", "api_keys.google is empty, speech requests will be rejected by the service");
    }
    return cfg;
}

} // namespace bootstrap_config

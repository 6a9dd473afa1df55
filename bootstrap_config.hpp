#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

#include "voice/voice_types.hpp"

// Centralized config bootstrap for WalletVoice
namespace bootstrap_config {

    // Typed view of voice_config.json
    struct VoiceConfig {
        std::string googleApiKey;

        // speech
        std::string recognizeUrl;
        std::string speechLanguage = "en-US";
        Voice::AudioFormat captureFormat;
        unsigned chunkMs = 100;
        int stopTimeoutMs = 1000;
        int inputDeviceIndex = -1;
        bool microphonePermission = true;

        // tts (text left empty)
        std::string synthesizeUrl;
        Voice::SynthesisRequest voice;

        // network
        int networkTimeoutMs = 30000;
        unsigned networkWorkers = 2;

        // chat
        std::string chatBackendUrl;

        // logging
        std::string logLevel = "debug";
        std::string logFile = "walletvoice.log";
    };

    // Run all config/error bootstrap, fills the global voiceConfig
    VoiceConfig initAll();

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Fill missing keys and replace values of the wrong type. Returns true if
    // anything changed.
    bool mergeDefaults(nlohmann::json& cfg,
                       const nlohmann::json& defs,
                       const std::string& prefix = "",
                       int* patchedCount = nullptr);

    // Typed view with out-of-range values clamped back to defaults
    VoiceConfig voiceConfigFromJson(const nlohmann::json& cfg);

    // WALLETVOICE_GOOGLE_API_KEY overrides api_keys.google when set
    void applyEnvironment(VoiceConfig& cfg);

    // Canonical defaults
    nlohmann::json defaultVoiceConfig();
    nlohmann::json defaultErrors();
}

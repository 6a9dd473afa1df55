#pragma once
#include <string>
#include <nlohmann/json_fwd.hpp>

// ------------------------------------------------------------
// Constants
// ------------------------------------------------------------
inline constexpr const char* VOICE_CONFIG_FILE = "voice_config.json";
inline constexpr const char* ERRORS_FILE       = "errors.json";
inline constexpr const char* DEFAULT_LOG_FILE  = "walletvoice.log";

// ------------------------------------------------------------
// Resource loading
// ------------------------------------------------------------
std::string getResourcePath();

// ------------------------------------------------------------
// Global voice config (JSON container, filled by bootstrap_config)
// ------------------------------------------------------------
extern nlohmann::json voiceConfig;

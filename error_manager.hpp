#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "voice/voice_types.hpp"

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
namespace ErrorManager {
    // Load error codes from JSON (errors.json)
    bool load(const std::string& path);

    // Use an already parsed table ({code: {user, debug}})
    void use(const nlohmann::json& table);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Report an error: logs "code -> debug" and returns the user-facing notice.
    // serviceCode (HTTP status) is appended to the user message when non-zero.
    Voice::Notice report(Voice::VoiceError error,
                         const std::string& detail = "",
                         int serviceCode = 0);

    // Same, for codes outside the voice taxonomy (config, commands)
    Voice::Notice report(const std::string& code, const std::string& detail = "");

    // Internal storage
    extern nlohmann::json root;
}

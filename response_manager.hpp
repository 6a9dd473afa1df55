#pragma once
#include <string>
#include "voice/voice_types.hpp"

namespace ResponseManager {
    std::string get(const std::string& keyOrMessage);

    // Informational notice for a response key (voice_start, tts_playing, ...)
    Voice::Notice info(const std::string& key, const std::string& suffix = "");
}

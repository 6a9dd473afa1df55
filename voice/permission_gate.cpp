#include "voice/permission_gate.hpp"
#include "logger.hpp"

namespace Voice {

void ConfigPermissionGate::setMicrophonePermission(bool granted) {
    bool was = granted_.exchange(granted);
    if (was != granted) {
        LOG_DEBUG("Permission", std::string("Microphone permission ") + (granted ? "granted" : "revoked"));
    }
}

} // namespace Voice

#pragma once
#include <atomic>

namespace Voice {

/// Answers whether the microphone may be opened. The prompt itself lives
/// outside this subsystem.
class PermissionGate {
public:
    virtual ~PermissionGate() = default;
    virtual bool hasMicrophonePermission() const = 0;
};

/// Backed by speech.microphone_permission, switchable at runtime.
class ConfigPermissionGate : public PermissionGate {
public:
    explicit ConfigPermissionGate(bool granted) : granted_(granted) {}

    bool hasMicrophonePermission() const override { return granted_.load(); }
    void setMicrophonePermission(bool granted);

private:
    std::atomic<bool> granted_;
};

} // namespace Voice

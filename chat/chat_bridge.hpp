#pragma once
#include <optional>
#include <string>

namespace Chat {

/// ChatSessionBridge
/// The chat flow as seen by the voice subsystem. A transcript goes in
/// exactly as a typed message would; the latest assistant reply can be read
/// back for speaking.
class ChatSessionBridge {
public:
    virtual ~ChatSessionBridge() = default;

    virtual void submit(const std::string& text) = 0;
    virtual std::optional<std::string> latestAssistantMessage() const = 0;
};

} // namespace Chat

#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chat/chat_bridge.hpp"
#include "chat/chat_history.hpp"
#include "voice/event_loop.hpp"
#include "voice/http_transport.hpp"
#include "voice/worker_pool.hpp"

namespace Chat {

struct ChatReply {
    bool ok = false;
    std::string text;
    std::string walletLink;
};

// {"answer": ..., "wallet_link": ...} when the backend answers in JSON,
// otherwise the raw body.
ChatReply parseChatReply(const Voice::HttpResponse& response);

/// ConsoleChat
/// Chat flow for the console build. A submitted message is logged as a user
/// entry and posted as {"question": text} to the backend; the answer is
/// logged as an assistant entry on the event loop.
class ConsoleChat : public ChatSessionBridge {
public:
    using EntryCallback = std::function<void(const ChatEntry&)>;

    ConsoleChat(ChatHistory& history,
                std::shared_ptr<Voice::HttpTransport> transport,
                Voice::WorkerPool& networkPool,
                Voice::EventLoop& loop,
                std::string backendUrl);

    void submit(const std::string& text) override;
    std::optional<std::string> latestAssistantMessage() const override;

    // Called on the loop for every assistant/system entry this class appends
    void addEntryListener(EntryCallback callback);

private:
    void append(Role role, const std::string& text, const std::string& walletLink = "");

    ChatHistory& history_;
    std::shared_ptr<Voice::HttpTransport> transport_;
    Voice::WorkerPool& pool_;
    Voice::EventLoop& loop_;
    std::string backendUrl_;

    std::mutex listenerMutex_;
    std::vector<EntryCallback> listeners_;
};

} // namespace Chat

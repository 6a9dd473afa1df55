#include "chat/console_chat.hpp"
#include "response_manager.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>

#include <exception>

namespace Chat {

// =========================================================
// Backend reply
// =========================================================
ChatReply parseChatReply(const Voice::HttpResponse& response) {
    ChatReply reply;
    if (!response.transportOk) {
        reply.text = response.error.empty() ? "connection failed" : response.error;
        return reply;
    }
    if (!response.ok()) {
        reply.text = "HTTP " + std::to_string(response.status);
        return reply;
    }

    reply.ok = true;
    auto j = nlohmann::json::parse(response.body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("answer") && j["answer"].is_string()) {
        reply.text = j["answer"].get<std::string>();
        if (j.contains("wallet_link") && j["wallet_link"].is_string()) {
            reply.walletLink = j["wallet_link"].get<std::string>();
        }
    } else {
        reply.text = response.body;
    }
    return reply;
}

// =========================================================
// ConsoleChat
// =========================================================
ConsoleChat::ConsoleChat(ChatHistory& history,
                         std::shared_ptr<Voice::HttpTransport> transport,
                         Voice::WorkerPool& networkPool,
                         Voice::EventLoop& loop,
                         std::string backendUrl)
    : history_(history),
      transport_(std::move(transport)),
      pool_(networkPool),
      loop_(loop),
      backendUrl_(std::move(backendUrl)) {}

void ConsoleChat::submit(const std::string& text) {
    history_.push(Role::User, text);
    LOG_DEBUG("Chat", "User message: " + text);

    if (backendUrl_.empty()) {
        std::string notice = ResponseManager::get("chat_no_backend");
        if (!loop_.post([this, notice]() { append(Role::System, notice); })) {
            LOG_WARN("Chat", "Loop closed, notice dropped");
        }
        return;
    }

    auto job = [this, text]() {
        ChatReply reply;
        try {
            std::string body = nlohmann::json{{"question", text}}
                                   .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            reply = parseChatReply(transport_->postJson(backendUrl_, body));
        } catch (const std::exception& e) {
            reply.ok = false;
            reply.text = e.what();
        }

        bool queued = loop_.post([this, reply]() {
            if (reply.ok) {
                append(Role::Assistant, reply.text, reply.walletLink);
            } else {
                LOG_ERROR("Chat", "Backend call failed: " + reply.text);
                append(Role::System, ResponseManager::get("chat_failed") + reply.text);
            }
        });
        if (!queued) {
            LOG_WARN("Chat", "Loop closed, backend reply dropped");
        }
    };

    if (!pool_.submit(std::move(job)).valid()) {
        LOG_ERROR("Chat", "Network pool is not accepting work");
    }
}

std::optional<std::string> ConsoleChat::latestAssistantMessage() const {
    auto entry = history_.latest(Role::Assistant);
    if (!entry) return std::nullopt;
    return entry->text;
}

void ConsoleChat::addEntryListener(EntryCallback callback) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listeners_.push_back(std::move(callback));
}

void ConsoleChat::append(Role role, const std::string& text, const std::string& walletLink) {
    history_.push(role, text, walletLink);

    std::vector<EntryCallback> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners = listeners_;
    }
    auto entry = history_.latest(role);
    if (!entry) return;
    for (const auto& cb : listeners) {
        if (cb) cb(*entry);
    }
}

} // namespace Chat

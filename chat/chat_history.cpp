#include "chat/chat_history.hpp"

namespace Chat {

const char* roleName(Role role) {
    switch (role) {
        case Role::User:      return "you";
        case Role::Assistant: return "assistant";
        case Role::System:    return "system";
    }
    return "?";
}

// Push a new entry into history
void ChatHistory::push(Role role, const std::string& text, const std::string& walletLink) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (raw_.size() >= kMaxHistory) {
        raw_.pop_front(); // cap history size
    }
    raw_.push_back({ role, text, walletLink, std::chrono::system_clock::now() });
}

// Clear history
void ChatHistory::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    raw_.clear();
}

// ---------------- Convenience ----------------

std::size_t ChatHistory::count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return raw_.size();
}

std::vector<ChatEntry> ChatHistory::entries() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return { raw_.begin(), raw_.end() };
}

std::optional<ChatEntry> ChatHistory::latest(Role role) const {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto it = raw_.rbegin(); it != raw_.rend(); ++it) {
        if (it->role == role) return *it;
    }
    return std::nullopt;
}

} // namespace Chat

#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Chat {

enum class Role { User, Assistant, System };
const char* roleName(Role role);

struct ChatEntry {
    Role role = Role::System;
    std::string text;
    std::string walletLink;   // optional deep link attached to an assistant reply
    std::chrono::system_clock::time_point at{};
};

/// ChatHistory
/// Ordered, capped log of the conversation. Safe to push from the loop and
/// read from the console thread.
class ChatHistory {
public:
    static constexpr std::size_t kMaxHistory = 200;

    /// Add a new entry (oldest entry dropped past kMaxHistory).
    void push(Role role, const std::string& text, const std::string& walletLink = "");

    /// Clear all entries.
    void clear();

    std::size_t count() const;
    std::vector<ChatEntry> entries() const;
    std::optional<ChatEntry> latest(Role role) const;

private:
    mutable std::mutex mtx_;
    std::deque<ChatEntry> raw_;
};

} // namespace Chat

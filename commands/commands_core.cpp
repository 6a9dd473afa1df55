#include "commands_core.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <vector>

// ------------------------------------------------------------
// Globals
// ------------------------------------------------------------
std::unordered_map<std::string, CommandFunc> commandMap;

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
static int levenshteinDistance(const std::string& s1, const std::string& s2) {
    const size_t m = s1.size(), n = s2.size();
    std::vector<int> prev(n + 1), curr(n + 1);

    for (size_t j = 0; j <= n; j++) prev[j] = static_cast<int>(j);

    for (size_t i = 1; i <= m; i++) {
        curr[0] = static_cast<int>(i);
        for (size_t j = 1; j <= n; j++) {
            int cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;
            curr[j] = std::min({ prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost });
        }
        prev.swap(curr);
    }
    return prev[n];
}

static std::string fuzzyMatch(const std::string& input) {
    std::string best = input;
    int bestDist = 2; // only allow corrections within distance < 2

    for (const auto& [key, _] : commandMap) {
        int dist = levenshteinDistance(input, key);
        if (dist < bestDist) {
            bestDist = dist;
            best = key;
        }
    }
    return best;
}

static std::string normalizeCommand(const std::string& input) {
    std::string out = input;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return fuzzyMatch(out);
}

CommandResult asyncAccepted(const std::string& what) {
    return { what, true, "ERR_NONE", "async" };
}

CommandResult fromNotice(const Voice::Notice& notice) {
    if (notice.isError()) {
        return { notice.message, false, notice.code, "error" };
    }
    return { notice.message, true, "ERR_NONE", "routine" };
}

// ------------------------------------------------------------
// Command Registration
// ------------------------------------------------------------
static void initCommands() {
    if (!commandMap.empty()) return; // already initialized

    commandMap = {
        // --- Voice input ---
        {"voice",          cmdVoice},
        {"voice_start",    cmdVoiceStart},
        {"voice_stop",     cmdVoiceStop},
        {"mic_permission", cmdMicPermission},
        {"devices",        cmdDevices},

        // --- Voice output ---
        {"say",            cmdSay},
        {"speak",          cmdSpeak},

        // --- Chat ---
        {"chat",           cmdChat},
        {"history",        cmdHistory},

        // --- Interface ---
        {"status",         cmdStatus},
        {"help",           cmdShowHelp}
    };
}

// ------------------------------------------------------------
// Core Dispatch
// ------------------------------------------------------------
std::pair<std::string, std::string> parseInput(const std::string& input) {
    auto start = input.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return {"", ""};
    }
    auto pos = input.find(' ', start);
    if (pos == std::string::npos) {
        return {input.substr(start), ""};
    }
    auto argStart = input.find_first_not_of(' ', pos);
    return {input.substr(start, pos - start),
            argStart == std::string::npos ? "" : input.substr(argStart)};
}

CommandResult dispatchCommand(const std::string& cmd, const std::string& arg) {
    initCommands();

    auto it = commandMap.find(cmd);
    if (it != commandMap.end()) {
        LOG_TRACE("Commands", "Found handler for cmd=\"" + cmd + "\" arg=\"" + arg + "\"");
        try {
            return it->second(arg);
        } catch (const std::exception& e) {
            LOG_ERROR("Commands", "Exception in command \"" + cmd + "\": " + e.what());
            return {
                "[Error] Exception while running command: " + cmd,
                false,
                "ERR_CMD_EXCEPTION",
                "error"
            };
        }
    }

    LOG_DEBUG("Commands", "Unknown command: \"" + cmd + "\"");
    return {
        ErrorManager::getUserMessage("ERR_CORE_UNKNOWN_COMMAND") + ": " + cmd,
        false,
        "ERR_CORE_UNKNOWN_COMMAND",
        "error"
    };
}

// ------------------------------------------------------------
// handleCommand: parse → dispatch → log → echo
// ------------------------------------------------------------
CommandResult handleCommand(const std::string& line) {
    initCommands();

    auto [cmdRaw, arg] = parseInput(line);
    LOG_TRACE("Commands", "parseInput → cmd=\"" + cmdRaw + "\" arg=\"" + arg + "\"");

    std::string cmd = cmdRaw;
    if (commandMap.find(cmd) == commandMap.end()) {
        cmd = normalizeCommand(cmdRaw);
        if (cmd != cmdRaw) {
            LOG_DEBUG("Commands", "Corrected \"" + cmdRaw + "\" → \"" + cmd + "\"");
        }
    }

    CommandResult result = dispatchCommand(cmd, arg);

    if (result.success) {
        LOG_DEBUG("Commands", cmd + " → " + (result.message.empty() ? "(no output)" : result.category));
    } else if (!result.errorCode.empty() && result.errorCode != "ERR_NONE") {
        LOG_ERROR("Commands", result.errorCode + " -> " + ErrorManager::getDebugMessage(result.errorCode));
    } else {
        LOG_ERROR("Commands", result.message);
    }

    // Async results show up as notices; everything else is echoed now
    if (result.category != "async" && !result.message.empty()) {
        std::cout << result.message << std::endl;
    }
    return result;
}

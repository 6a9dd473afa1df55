#pragma once
#include <string>
#include <unordered_map>
#include <utility>

#include "voice/voice_types.hpp"

// ------------------------------------------------------------
// CommandResult: unified return type for all commands
// ------------------------------------------------------------
struct CommandResult {
    std::string message;    // user-facing text
    bool success = true;    // true if command succeeded
    std::string errorCode;  // optional error code for ErrorManager/Logger
    std::string category;   // "routine", "summary", "error", "async"
};

// Async commands return this; their outcome arrives later as a notice
CommandResult asyncAccepted(const std::string& what);

// Error notice -> failed result, info notice -> routine result
CommandResult fromNotice(const Voice::Notice& notice);

// ------------------------------------------------------------
// Function pointer type for commands
// ------------------------------------------------------------
using CommandFunc = CommandResult(*)(const std::string& arg);

// ------------------------------------------------------------
// Globals (declared here, defined in commands_core.cpp)
// ------------------------------------------------------------
extern std::unordered_map<std::string, CommandFunc> commandMap;

// ------------------------------------------------------------
// Public API
// ------------------------------------------------------------
std::pair<std::string, std::string> parseInput(const std::string& input);
CommandResult dispatchCommand(const std::string& cmd, const std::string& arg);

// Parse, dispatch, log and echo one console line
CommandResult handleCommand(const std::string& line);

#include "commands_interface.hpp"
#include "commands_voice.hpp"

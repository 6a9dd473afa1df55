#pragma once
#include "commands_core.hpp"

// Voice commands
CommandResult cmdVoice(const std::string& arg);
CommandResult cmdVoiceStart(const std::string& arg);
CommandResult cmdVoiceStop(const std::string& arg);
CommandResult cmdMicPermission(const std::string& arg);
CommandResult cmdDevices(const std::string& arg);
CommandResult cmdSay(const std::string& arg);
CommandResult cmdSpeak(const std::string& arg);

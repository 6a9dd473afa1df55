#pragma once
#include "commands_core.hpp"

// Chat / utility commands
CommandResult cmdChat(const std::string& arg);
CommandResult cmdHistory(const std::string& arg);
CommandResult cmdStatus(const std::string& arg);
CommandResult cmdShowHelp(const std::string& arg);

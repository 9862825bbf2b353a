#pragma once
#include "commands_core.hpp"

// Utility commands
CommandResult cmdShowHelp(const std::string& arg);

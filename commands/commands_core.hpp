#pragma once
#include <string>
#include <unordered_map>
#include <utility>

// ------------------------------------------------------------
// CommandResult: unified return type for all commands
// ------------------------------------------------------------
struct CommandResult {
    std::string message;    // user-facing text
    bool success = false;   // true if command succeeded
    std::string errorCode;  // optional error code for ErrorManager/Logger
    std::string category;   // "routine", "summary", "error"
};

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

// Parses, dispatches, logs and echoes the result to stdout
CommandResult handleCommand(const std::string& line);

#include "commands_interface.hpp"
#include "commands_engine.hpp"

#include "error_manager.hpp"
#include "logger.hpp"
#include "commands_core.hpp"

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

// Single-typo correction ("strat" -> "start")
static std::string fuzzyMatch(const std::string& input) {
    std::string best = input;
    int bestDist = 2;

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

static std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \n\r\t");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \n\r\t");
    return s.substr(first, last - first + 1);
}

// ------------------------------------------------------------
// Command Registration
// ------------------------------------------------------------
static void initCommands() {
    if (!commandMap.empty()) return; // already initialized

    commandMap = {
        // --- Engine ---
        {"start",   cmdStart},
        {"stop",    cmdStop},
        {"status",  cmdStatus},
        {"devices", cmdDevices},

        // --- Interface ---
        {"help",    cmdShowHelp}
    };
}

// ------------------------------------------------------------
// Core Dispatch
// ------------------------------------------------------------
std::pair<std::string, std::string> parseInput(const std::string& input) {
    std::string line = trim(input);
    auto pos = line.find(' ');
    if (pos == std::string::npos) {
        return {line, ""};
    }
    return {line.substr(0, pos), trim(line.substr(pos + 1))};
}

CommandResult dispatchCommand(const std::string& cmd, const std::string& arg) {
    initCommands();

    auto it = commandMap.find(cmd);
    if (it != commandMap.end()) {
        LOG_TRACE("Console", "Found handler for cmd=\"" + cmd + "\" arg=\"" + arg + "\"");
        try {
            return it->second(arg);
        } catch (const std::exception& e) {
            return ErrorManager::report("ERR_CMD_EXCEPTION", cmd + ": " + e.what());
        }
    }

    LOG_DEBUG("Console", "Unknown command: \"" + cmd + "\"");
    return ErrorManager::report("ERR_CMD_UNKNOWN", cmd);
}

// ------------------------------------------------------------
// handleCommand: parse → dispatch → log → echo
// ------------------------------------------------------------
CommandResult handleCommand(const std::string& line) {
    initCommands();

    auto [cmdRaw, arg] = parseInput(line);

    std::string cmd = cmdRaw;
    if (commandMap.find(cmd) == commandMap.end()) {
        cmd = normalizeCommand(cmdRaw);
        if (cmd != cmdRaw) {
            LOG_DEBUG("Console", "Corrected \"" + cmdRaw + "\" → \"" + cmd + "\"");
        }
    }

    CommandResult result = dispatchCommand(cmd, arg);

    if (result.message.empty()) {
        result.message = "[no response configured]";
        result.success = false;
        if (result.errorCode.empty()) result.errorCode = "ERR_NONE";
    }

    Logger::logResult(result);
    std::cout << result.message << std::endl;
    return result;
}

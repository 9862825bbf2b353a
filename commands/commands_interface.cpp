#include "commands_interface.hpp"

#include <string>

// ------------------------------------------------------------
// [Utility] Show help text
// ------------------------------------------------------------
CommandResult cmdShowHelp([[maybe_unused]] const std::string& arg) {
    std::string helpText =
        "[Help] Available commands:\n"
        "- start                     translate with the configured languages\n"
        "- start <target>            auto-detect the source language\n"
        "- start <source> <target>\n"
        "- stop\n"
        "- status\n"
        "- devices\n"
        "- help\n"
        "- quit / exit";

    return {
        helpText,
        true,
        "ERR_NONE",
        "summary"
    };
}

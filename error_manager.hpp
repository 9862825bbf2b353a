#pragma once

#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>

// Undefine Windows ERROR macro if it leaks in
#ifdef ERROR
#undef ERROR
#endif

#include "commands/commands_core.hpp"

// ------------------------------------------------------------
// Error taxonomy
// ------------------------------------------------------------
enum class ErrorKind {
    Configuration,
    Connection,
    Capture,
    Playback,
    Protocol,
    Engine,
    Command
};

const char* errorKindName(ErrorKind kind);

// Thrown when an operation has to be aborted; also handed to error
// listeners by value for failures that do not abort anything.
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, std::string code, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& code() const noexcept { return code_; }

private:
    ErrorKind kind_;
    std::string code_;
};

// ------------------------------------------------------------
// Logger (command results)
// ------------------------------------------------------------
namespace Logger {
    void logResult(const CommandResult& result);
}

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
namespace ErrorManager {
    // Load error codes from JSON (errors.json)
    void load(const std::string& path);
    void loadCatalog(const nlohmann::json& catalog);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Kind is derived from the code prefix (ERR_CAPTURE_* -> Capture, ...)
    ErrorKind kindOf(const std::string& code);

    // Build an EngineError for code; detail is appended to the user message
    EngineError make(const std::string& code, const std::string& detail = "");

    // make() + throw
    [[noreturn]] void raise(const std::string& code, const std::string& detail = "");

    // Report an error (returns CommandResult)
    CommandResult report(const std::string& code, const std::string& detail = "");

    // Internal storage
    extern nlohmann::json root;
}

#include "error_manager.hpp"
#include "logger.hpp"

#include <fstream>
#include <filesystem>
#include <mutex>
#include <utility>

// ------------------------------------------------------------
// EngineError
// ------------------------------------------------------------
const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Connection:    return "connection";
        case ErrorKind::Capture:       return "capture";
        case ErrorKind::Playback:      return "playback";
        case ErrorKind::Protocol:      return "protocol";
        case ErrorKind::Engine:        return "engine";
        case ErrorKind::Command:       return "command";
    }
    return "unknown";
}

EngineError::EngineError(ErrorKind kind, std::string code, const std::string& message)
    : std::runtime_error(message), kind_(kind), code_(std::move(code)) {}

// ------------------------------------------------------------
// Logger implementation
// ------------------------------------------------------------
namespace Logger {

    void logResult(const CommandResult& result) {
        if (result.success) {
            LOG_INFO("Command", result.message);
        } else {
            if (!result.errorCode.empty() && result.errorCode != "ERR_NONE") {
                std::string debugMsg = ErrorManager::getDebugMessage(result.errorCode);
                LOG_ERROR("Command", result.errorCode + " -> " + debugMsg);
            } else {
                LOG_ERROR("Command", result.message);
            }
        }
    }

} // namespace Logger

// ------------------------------------------------------------
// ErrorManager implementation
// ------------------------------------------------------------
nlohmann::json ErrorManager::root = nlohmann::json::object();
static std::mutex g_catalogMutex;

void ErrorManager::loadCatalog(const nlohmann::json& catalog) {
    std::lock_guard<std::mutex> lock(g_catalogMutex);
    if (catalog.contains("errors") && catalog["errors"].is_object()) {
        root = catalog["errors"];
    } else if (catalog.is_object()) {
        root = catalog;
    } else {
        root = nlohmann::json::object();
    }
}

void ErrorManager::load(const std::string& path) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("ErrorManager", "Could not open " + path);
        return;
    }

    try {
        nlohmann::json errors;
        in >> errors;
        loadCatalog(errors);
        LOG_DEBUG("ErrorManager", "Loaded " + std::to_string(root.size()) +
                                  " error codes from: " + fs::absolute(path).string());
    } catch (const std::exception& e) {
        LOG_ERROR("ErrorManager", "Failed to parse " + path + " -> " + e.what());
    }
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_catalogMutex);
    if (root.contains(code) && root[code].contains("user")) {
        return root[code]["user"].get<std::string>();
    }
    return "[Error] Unknown error code: " + code;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_catalogMutex);
    if (root.contains(code) && root[code].contains("debug")) {
        return root[code]["debug"].get<std::string>();
    }
    return "[Debug] No debug message for code: " + code;
}

ErrorKind ErrorManager::kindOf(const std::string& code) {
    auto startsWith = [&code](const char* prefix) { return code.rfind(prefix, 0) == 0; };

    if (startsWith("ERR_CONFIG_") || code == "ERR_ENGINE_NOT_CONFIGURED") return ErrorKind::Configuration;
    if (startsWith("ERR_CONNECT") || startsWith("ERR_SEND_"))            return ErrorKind::Connection;
    if (startsWith("ERR_CAPTURE_"))                                      return ErrorKind::Capture;
    if (startsWith("ERR_PLAYBACK_"))                                     return ErrorKind::Playback;
    if (startsWith("ERR_PROTOCOL_"))                                     return ErrorKind::Protocol;
    if (startsWith("ERR_CMD_"))                                          return ErrorKind::Command;
    return ErrorKind::Engine;
}

EngineError ErrorManager::make(const std::string& code, const std::string& detail) {
    std::string message = getUserMessage(code);
    if (!detail.empty()) {
        message += " (" + detail + ")";
    }

    LOG_ERROR("ErrorManager", code + " -> " + getDebugMessage(code) +
                              (detail.empty() ? "" : " | " + detail));
    return EngineError(kindOf(code), code, message);
}

void ErrorManager::raise(const std::string& code, const std::string& detail) {
    throw make(code, detail);
}

CommandResult ErrorManager::report(const std::string& code, const std::string& detail) {
    EngineError err = make(code, detail);

    CommandResult result;
    result.success   = false;
    result.message   = err.what();
    result.errorCode = code;
    result.category  = "error";
    return result;
}

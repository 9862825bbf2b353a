#pragma once
#include <string>
#include <chrono>
#include <cstdint>

// =====================================================
// Log Level
// =====================================================
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error
};

// =====================================================
// Phase Info Struct
// =====================================================
struct PhaseInfo {
    std::chrono::system_clock::time_point timestamp; // when entered
    std::string fileName;    // file containing this phase
    std::string phaseName;   // descriptive phase string
    bool success;            // true = success, false = failure
};

// Global storage for most recent phase
extern PhaseInfo g_phaseInfo;

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename,
                std::uintmax_t maxFileBytes = 5 * 1024 * 1024);
void shutdownLogger();

// Lines below this level are dropped (phases are always written)
void setLogLevel(LogLevel level);
LogLevel logLevelFromString(const std::string& name);

// =====================================================
// Core Logging Functions
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success);

void logTrace(const std::string& tag, const std::string& msg);
void logDebug(const std::string& tag, const std::string& msg);
void logInfo(const std::string& tag, const std::string& msg);
void logWarn(const std::string& tag, const std::string& msg);
void logError(const std::string& tag, const std::string& msg);

// =====================================================
// Phase Group Controls (buffered block logging)
// =====================================================
void beginPhaseGroup();
void endPhaseGroup();

// =====================================================
// Macros for convenience
// =====================================================
#define LOG_PHASE(phase, success) logPhaseInternal(__FILE__, phase, success)
#define LOG_TRACE(tag, msg) logTrace(tag, msg)
#define LOG_DEBUG(tag, msg) logDebug(tag, msg)
#define LOG_INFO(tag, msg) logInfo(tag, msg)
#define LOG_WARN(tag, msg) logWarn(tag, msg)
#define LOG_ERROR(tag, msg) logError(tag, msg)

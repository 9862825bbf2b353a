#include "logger.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <mutex>
#include <vector>
#include <filesystem>
#include <chrono>
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

// =====================================================
// Globals
// =====================================================
PhaseInfo g_phaseInfo{};
static std::mutex g_logMutex;

#if defined(_DEBUG)
static LogLevel g_minLevel = LogLevel::Trace;
#else
static LogLevel g_minLevel = LogLevel::Debug;
#endif

// Buffer for grouped phase logging
static bool g_buffering = false;
static std::vector<std::string> g_phaseBuffer;

// File output stream + rotation bookkeeping
static std::ofstream g_logFile;
static fs::path g_logPath;
static std::uintmax_t g_maxFileBytes = 0;
static std::uintmax_t g_writtenBytes = 0;

// =====================================================
// Helpers
// =====================================================
static std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

static std::string nowTimestamp() {
    return formatTimestamp(std::chrono::system_clock::now());
}

static std::string basename(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return (pos == std::string::npos) ? path : path.substr(pos + 1);
}

static const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

// Caller holds g_logMutex
static void rotateIfNeeded() {
    if (!g_logFile.is_open() || g_maxFileBytes == 0 || g_writtenBytes < g_maxFileBytes) {
        return;
    }

    g_logFile.close();

    std::error_code ec;
    fs::path rotated = g_logPath;
    rotated += ".1";
    fs::remove(rotated, ec);
    fs::rename(g_logPath, rotated, ec);
    if (ec) {
        std::cerr << "[Logger] Could not rotate log file: " << ec.message() << std::endl;
    }

    g_logFile.open(g_logPath, std::ios::out | std::ios::trunc);
    g_writtenBytes = 0;
}

static void writeLine(const std::string& line) {
    if (g_logFile.is_open()) {
        g_logFile << line << std::endl;
        g_writtenBytes += line.size() + 1;
        rotateIfNeeded();
    }

    std::cerr << line << std::endl;
}

static void logAt(LogLevel level, const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (level < g_minLevel) return;
    writeLine("[" + nowTimestamp() + "][" + levelName(level) + "][" + tag + "] " + msg);
}

// =====================================================
// Level controls
// =====================================================
void setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_minLevel = level;
}

LogLevel logLevelFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "info")  return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return LogLevel::Debug;
}

// =====================================================
// Buffering controls
// =====================================================
void beginPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_buffering = true;
    g_phaseBuffer.clear();
}

void endPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    for (auto& line : g_phaseBuffer) {
        writeLine(line);
    }
    g_phaseBuffer.clear();
    g_buffering = false;
}

// =====================================================
// Phase Logging
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success)
{
    std::lock_guard<std::mutex> lock(g_logMutex);

    g_phaseInfo.timestamp = std::chrono::system_clock::now();
    g_phaseInfo.fileName  = basename(file);
    g_phaseInfo.phaseName = phase;
    g_phaseInfo.success   = success;

    std::ostringstream oss;
    oss << "| " << formatTimestamp(g_phaseInfo.timestamp)
        << " | " << g_phaseInfo.fileName
        << " | " << g_phaseInfo.phaseName
        << " | " << (g_phaseInfo.success ? "true" : "false")
        << " |";

    std::string entry = oss.str();

    if (g_buffering) {
        g_phaseBuffer.push_back(entry);
    } else {
        writeLine(entry);
    }
}

// =====================================================
// Leveled Logging
// =====================================================
void logTrace(const std::string& tag, const std::string& msg) { logAt(LogLevel::Trace, tag, msg); }
void logDebug(const std::string& tag, const std::string& msg) { logAt(LogLevel::Debug, tag, msg); }
void logInfo(const std::string& tag, const std::string& msg)  { logAt(LogLevel::Info, tag, msg); }
void logWarn(const std::string& tag, const std::string& msg)  { logAt(LogLevel::Warn, tag, msg); }
void logError(const std::string& tag, const std::string& msg) { logAt(LogLevel::Error, tag, msg); }

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename, std::uintmax_t maxFileBytes) {
    std::lock_guard<std::mutex> lock(g_logMutex);

    if (g_logFile.is_open()) {
        g_logFile.close();
    }

    g_logPath = fs::absolute(filename);
    g_maxFileBytes = maxFileBytes;

    std::error_code ec;
    g_writtenBytes = fs::exists(g_logPath, ec) ? fs::file_size(g_logPath, ec) : 0;
    if (ec) g_writtenBytes = 0;

    g_logFile.open(g_logPath, std::ios::out | std::ios::app);

    if (g_logFile.is_open()) {
        writeLine("==== LiveDub Log Started ====");

        // Always print the log path so devs/users know where to look
        writeLine("[" + nowTimestamp() + "][Logger] Writing logs to: " + g_logPath.string());
    } else {
        std::cerr << "[Logger] ERROR: Could not open log file: "
                  << g_logPath.string() << std::endl;
    }
}

void shutdownLogger() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logFile.is_open()) {
        g_logFile << "==== LiveDub Log Ended ====" << std::endl;
        g_logFile.close();
    }
}

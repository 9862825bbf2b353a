#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "audio/audio_source.hpp"
#include "realtime/session_config.hpp"
#include "scheduler/commit_state.hpp"

// ------------------------------------------------------------
// Typed view of dub_config.json
// ------------------------------------------------------------
struct LoggingSettings {
    std::string file = "livedub.log";
    std::string level = "debug";
    std::uintmax_t maxFileBytes = 5 * 1024 * 1024;
};

struct Settings {
    Realtime::SessionConfig session;        // endpoint, languages, audio format, response params
    int playbackSampleRate = 24000;
    Audio::CaptureSettings capture;
    Scheduler::CommitTuning tuning;
    LoggingSettings logging;

    // Missing keys keep their defaults. LIVEDUB_API_KEY overrides realtime.api_key.
    static Settings fromJson(const nlohmann::json& cfg);

    // First configuration error code, std::nullopt when usable
    std::optional<std::string> validate() const;
    bool isConfigured() const { return !validate().has_value(); }

    // Session config with the languages for one start() call
    Realtime::SessionConfig sessionFor(const std::optional<std::string>& sourceLanguage,
                                       const std::string& targetLanguage) const;
};

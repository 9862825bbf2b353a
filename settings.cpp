#include "settings.hpp"
#include "logger.hpp"

#include <cstdlib>

// ---------------- helpers ----------------
template <typename T>
static T readOr(const nlohmann::json& section, const char* key, const T& fallback) {
    if (!section.is_object()) return fallback;
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) return fallback;
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Config", std::string("Ignoring bad value for ") + key + ": " + e.what());
        return fallback;
    }
}

static const nlohmann::json& sectionOf(const nlohmann::json& cfg, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!cfg.is_object()) return empty;
    auto it = cfg.find(name);
    return (it != cfg.end() && it->is_object()) ? *it : empty;
}

// ---------------- load ----------------
Settings Settings::fromJson(const nlohmann::json& cfg) {
    Settings s;

    const auto& rt = sectionOf(cfg, "realtime");
    auto& ep = s.session.endpoint;
    ep.endpoint         = readOr<std::string>(rt, "endpoint", ep.endpoint);
    ep.apiKey           = readOr<std::string>(rt, "api_key", ep.apiKey);
    ep.deployment       = readOr<std::string>(rt, "deployment", ep.deployment);
    ep.apiVersion       = readOr<std::string>(rt, "api_version", ep.apiVersion);
    ep.connectTimeoutMs = readOr<int>(rt, "connect_timeout_ms", ep.connectTimeoutMs);
    s.session.voice                   = readOr<std::string>(rt, "voice", s.session.voice);
    s.session.transcriptionModel      = readOr<std::string>(rt, "transcription_model", s.session.transcriptionModel);
    s.session.maxResponseOutputTokens = readOr<int>(rt, "max_response_output_tokens", s.session.maxResponseOutputTokens);
    s.session.temperature             = readOr<double>(rt, "temperature", s.session.temperature);

    if (const char* envKey = std::getenv("LIVEDUB_API_KEY"); envKey && *envKey) {
        ep.apiKey = envKey;
        LOG_DEBUG("Config", "Using API key from LIVEDUB_API_KEY");
    }

    const auto& tr = sectionOf(cfg, "translation");
    s.session.sourceLanguage = readOr<std::string>(tr, "source_language", s.session.sourceLanguage);
    s.session.targetLanguage = readOr<std::string>(tr, "target_language", s.session.targetLanguage);

    const auto& au = sectionOf(cfg, "audio");
    s.session.sampleRate      = readOr<int>(au, "sample_rate", s.session.sampleRate);
    s.session.channels        = readOr<int>(au, "channels", s.session.channels);
    s.session.bufferSizeBytes = readOr<int>(au, "buffer_size_bytes", s.session.bufferSizeBytes);
    s.playbackSampleRate      = readOr<int>(au, "playback_sample_rate", s.playbackSampleRate);
    s.capture.mode = Audio::captureModeFromString(readOr<std::string>(au, "capture_mode", "microphone"));
    s.capture.inputDeviceIndex   = readOr<int>(au, "input_device_index", s.capture.inputDeviceIndex);
    s.capture.monitorDevice      = readOr<std::string>(au, "monitor_device", s.capture.monitorDevice);

    const auto& sc = sectionOf(cfg, "scheduler");
    auto& t = s.tuning;
    t.initialIntervalMs   = readOr<int>(sc, "initial_commit_interval_ms", t.initialIntervalMs);
    t.minIntervalMs       = readOr<int>(sc, "min_commit_interval_ms", t.minIntervalMs);
    t.maxIntervalMs       = readOr<int>(sc, "max_commit_interval_ms", t.maxIntervalMs);
    t.adjustmentMs        = readOr<int>(sc, "interval_adjustment_ms", t.adjustmentMs);
    t.maxPendingResponses = readOr<int>(sc, "max_pending_responses", t.maxPendingResponses);
    t.minAudioBytes       = readOr<int>(sc, "min_audio_bytes_for_commit", t.minAudioBytes);
    t.silenceThresholdMs  = readOr<int>(sc, "audio_silence_threshold_ms", t.silenceThresholdMs);
    t = t.sanitized();

    const auto& lg = sectionOf(cfg, "logging");
    s.logging.file         = readOr<std::string>(lg, "file", s.logging.file);
    s.logging.level        = readOr<std::string>(lg, "level", s.logging.level);
    s.logging.maxFileBytes = readOr<std::uintmax_t>(lg, "max_file_bytes", s.logging.maxFileBytes);

    return s;
}

// ---------------- validation ----------------
std::optional<std::string> Settings::validate() const {
    const auto& ep = session.endpoint;
    if (ep.endpoint.empty())   return std::string("ERR_CONFIG_MISSING_ENDPOINT");
    if (ep.apiKey.empty())     return std::string("ERR_CONFIG_MISSING_KEY");
    if (ep.deployment.empty()) return std::string("ERR_CONFIG_MISSING_DEPLOYMENT");
    if (session.targetLanguage.empty()) return std::string("ERR_CONFIG_MISSING_TARGET");

    if (session.sampleRate <= 0 || session.channels <= 0 || session.bufferSizeBytes <= 0 ||
        playbackSampleRate <= 0) {
        return std::string("ERR_CONFIG_INVALID_AUDIO");
    }
    return std::nullopt;
}

Realtime::SessionConfig Settings::sessionFor(const std::optional<std::string>& sourceLanguage,
                                             const std::string& targetLanguage) const {
    Realtime::SessionConfig cfg = session;
    cfg.sourceLanguage = sourceLanguage.value_or("");
    cfg.targetLanguage = targetLanguage;
    return cfg;
}

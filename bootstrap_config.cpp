#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace bootstrap_config {

// ----------------- helpers -----------------
bool mergeDefaults(nlohmann::json& cfg,
                   const nlohmann::json& defs,
                   int* patchedCount) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal, patchedCount))
                patched = true;
        } else if (defVal.is_number() && cfg[key].is_number()) {
            // 0.7 vs 1 or 3200 vs 3200u are the same kind of value
            continue;
        } else if (cfg[key].type() != defVal.type()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

// ----------------- defaults -----------------
nlohmann::json defaultDub() {
    return {
        {"realtime", {
            {"endpoint", ""},
            {"api_key", ""},
            {"deployment", ""},
            {"api_version", "2024-10-01-preview"},
            {"voice", "alloy"},
            {"transcription_model", "whisper-1"},
            {"max_response_output_tokens", 150},
            {"temperature", 0.7},
            {"connect_timeout_ms", 30000}
        }},

        {"translation", {
            {"source_language", ""},
            {"target_language", "ro"}
        }},

        {"audio", {
            {"sample_rate", 16000},
            {"channels", 1},
            {"buffer_size_bytes", 3200},
            {"playback_sample_rate", 24000},
            {"capture_mode", "microphone"},
            {"input_device_index", -1},
            {"monitor_device", ""}
        }},

        {"scheduler", {
            {"initial_commit_interval_ms", 2000},
            {"min_commit_interval_ms", 1000},
            {"max_commit_interval_ms", 5000},
            {"interval_adjustment_ms", 500},
            {"max_pending_responses", 2},
            {"min_audio_bytes_for_commit", 1600},
            {"audio_silence_threshold_ms", 3000}
        }},

        {"logging", {
            {"file", "livedub.log"},
            {"level", "debug"},
            {"max_file_bytes", 5242880}
        }}
    };
}

nlohmann::json defaultErrors() {
    return {
        // ---- configuration ----
        {"ERR_CONFIG_MISSING_ENDPOINT", {
            {"user", "[Config] realtime.endpoint is not set."},
            {"debug", "Settings::validate: empty endpoint."}
        }},
        {"ERR_CONFIG_MISSING_KEY", {
            {"user", "[Config] No API key. Set realtime.api_key or LIVEDUB_API_KEY."},
            {"debug", "Settings::validate: empty api key."}
        }},
        {"ERR_CONFIG_MISSING_DEPLOYMENT", {
            {"user", "[Config] realtime.deployment is not set."},
            {"debug", "Settings::validate: empty deployment."}
        }},
        {"ERR_CONFIG_MISSING_TARGET", {
            {"user", "[Config] No target language. Use: start [<source>] <target>"},
            {"debug", "Target language empty in settings and start arguments."}
        }},
        {"ERR_CONFIG_INVALID_AUDIO", {
            {"user", "[Config] Audio settings are invalid."},
            {"debug", "Non-positive sample rate, channel count, buffer size or playback rate."}
        }},
        {"ERR_CONFIG_FILE_INVALID", {
            {"user", "[Config] Config file invalid → reset to defaults."},
            {"debug", "dub_config.json failed parsing."}
        }},

        // ---- connection ----
        {"ERR_CONNECT_TIMEOUT", {
            {"user", "[Connection] Timed out connecting to the translation service."},
            {"debug", "WebSocket upgrade did not finish within connect_timeout_ms."}
        }},
        {"ERR_CONNECT_UPGRADE_REJECTED", {
            {"user", "[Connection] The translation service refused the connection."},
            {"debug", "Server answered the WebSocket upgrade with a non-101 status."}
        }},
        {"ERR_CONNECT_FAILED", {
            {"user", "[Connection] Could not connect to the translation service."},
            {"debug", "Transport open failed before the upgrade (DNS, TCP, TLS)."}
        }},
        {"ERR_CONNECTION_LOST", {
            {"user", "[Connection] Connection to the translation service was lost."},
            {"debug", "Receive/send failed or server closed while the session was active."}
        }},
        {"ERR_SEND_FAILED", {
            {"user", "[Connection] Could not send to the translation service."},
            {"debug", "curl_ws_send failed or the connection was not open."}
        }},

        // ---- capture ----
        {"ERR_CAPTURE_INIT", {
            {"user", "[Capture] Could not start audio capture."},
            {"debug", "PortAudio initialize/open/start failed."}
        }},
        {"ERR_CAPTURE_NO_DEVICE", {
            {"user", "[Capture] No usable input device. Run 'devices' to list them."},
            {"debug", "Configured or default input device index is invalid."}
        }},
        {"ERR_CAPTURE_NO_MONITOR", {
            {"user", "[Capture] No monitor/loopback device found for media capture."},
            {"debug", "No input device name matched audio.monitor_device."}
        }},
        {"ERR_CAPTURE_STREAM", {
            {"user", "[Capture] Audio capture stopped unexpectedly."},
            {"debug", "PortAudio stream finished while capture was running."}
        }},

        // ---- playback ----
        {"ERR_PLAYBACK_INIT", {
            {"user", "[Playback] Could not start audio playback."},
            {"debug", "sf::SoundStream did not reach Playing."}
        }},
        {"ERR_PLAYBACK_STREAM", {
            {"user", "[Playback] Audio playback stopped unexpectedly."},
            {"debug", "sf::SoundStream stopped while playback was active."}
        }},

        // ---- protocol ----
        {"ERR_PROTOCOL_REMOTE", {
            {"user", "[Service] The translation service reported an error."},
            {"debug", "Inbound 'error' message."}
        }},

        // ---- engine ----
        {"ERR_ENGINE_ALREADY_ACTIVE", {
            {"user", "[Engine] Translation is already running."},
            {"debug", "start() called while a session is active."}
        }},
        {"ERR_ENGINE_NOT_CONFIGURED", {
            {"user", "[Engine] Not configured. Fill in realtime.* in dub_config.json."},
            {"debug", "start() refused: Settings::validate failed."}
        }},
        {"ERR_ENGINE_START_FAILED", {
            {"user", "[Engine] Translation could not be started."},
            {"debug", "Unexpected exception during start(); everything started so far was released."}
        }},

        // ---- console ----
        {"ERR_CMD_UNKNOWN", {
            {"user", "[Console] Unknown command. Type 'help'."},
            {"debug", "No handler in commandMap."}
        }},
        {"ERR_CMD_EXCEPTION", {
            {"user", "[Console] Command failed."},
            {"debug", "Exception escaped a command handler."}
        }}
    };
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);

        LOG_PHASE(name + " created", true);
        return true;
    }

    try {
        std::ifstream f(path);
        f >> outConfig;

        int patchedCount = 0;
        if (mergeDefaults(outConfig, defaults, &patchedCount)) {
            std::ofstream(path) << outConfig.dump(2);
            LOG_PHASE(name + " patched", true);
            LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
        } else {
            LOG_PHASE(name + " load", true);
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Config", name + " invalid → reset to defaults (" + e.what() + ")");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::report(errorCode, path.string());

        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);
        return false;
    }
}

// ----------------- entry -----------------
void initAll(const fs::path& configPath) {
    // errors.json first so config problems resolve to catalog messages
    fs::path errPath = fs::path(getResourcePath()) / ERRORS_FILE;
    nlohmann::json errorsCfg;
    loadConfig(errPath, defaultErrors(), errorsCfg, "Errors config", "");
    ErrorManager::loadCatalog(errorsCfg);

    // dub_config.json
    loadConfig(configPath, defaultDub(), dubConfig, "Dub config", "ERR_CONFIG_FILE_INVALID");
}

} // namespace bootstrap_config

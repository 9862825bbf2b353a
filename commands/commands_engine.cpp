#include "commands_engine.hpp"
#include "engine/translation_engine.hpp"
#include "device_setups/audio_devices.hpp"
#include "error_manager.hpp"

#include <sstream>
#include <vector>

static Engine::TranslationEngine* g_engine = nullptr;

void bindEngine(Engine::TranslationEngine* engine) {
    g_engine = engine;
}

static CommandResult noEngine() {
    return {"[Engine] No engine available.", false, "ERR_NONE", "error"};
}

// ------------------------------------------------------------
// [Engine] start [<source>] <target>
// ------------------------------------------------------------
CommandResult cmdStart(const std::string& arg) {
    if (!g_engine) return noEngine();

    if (g_engine->isActive()) {
        return ErrorManager::report("ERR_ENGINE_ALREADY_ACTIVE");
    }

    std::istringstream iss(arg);
    std::vector<std::string> words;
    for (std::string w; iss >> w;) words.push_back(w);

    if (words.size() > 2) {
        return {"[Engine] Usage: start [<source>] <target>", false, "ERR_NONE", "error"};
    }

    const auto& configured = g_engine->settings().session;
    std::optional<std::string> source;
    std::string target;
    if (words.empty()) {
        if (!configured.sourceLanguage.empty()) source = configured.sourceLanguage;
        target = configured.targetLanguage;
    } else if (words.size() == 1) {
        target = words[0];
    } else {
        source = words[0];
        target = words[1];
    }

    try {
        if (!g_engine->start(source, target)) {
            return {"[Engine] Translation not started.", false, "ERR_ENGINE_NOT_CONFIGURED", "error"};
        }
    } catch (const EngineError& e) {
        return {"[Engine] Translation not started.", false, e.code(), "error"};
    }

    return {
        "[Engine] Translating " + (source ? *source : std::string("auto")) + " → " + target +
            ". Type 'stop' to end.",
        true,
        "ERR_NONE",
        "routine"
    };
}

// ------------------------------------------------------------
// [Engine] stop
// ------------------------------------------------------------
CommandResult cmdStop([[maybe_unused]] const std::string& arg) {
    if (!g_engine) return noEngine();

    if (!g_engine->isActive()) {
        return {"[Engine] Translation is not running.", true, "ERR_NONE", "routine"};
    }

    g_engine->stop();
    return {"[Engine] Translation stopped.", true, "ERR_NONE", "routine"};
}

// ------------------------------------------------------------
// [Engine] status
// ------------------------------------------------------------
CommandResult cmdStatus([[maybe_unused]] const std::string& arg) {
    if (!g_engine) return noEngine();

    auto s = g_engine->status();

    std::ostringstream oss;
    oss << "[Status] " << (s.active ? "active" : "idle")
        << " | session: " << s.sessionState;
    if (s.active) {
        oss << " | " << (s.sourceLanguage.empty() ? "auto" : s.sourceLanguage)
            << " → " << s.targetLanguage;
    }
    oss << "\n  commit interval: " << s.commitIntervalMs << "ms"
        << " | pending responses: " << s.pendingResponses
        << "\n  chunks captured: " << s.chunksCaptured
        << " | queued for playback: " << s.queuedPlaybackChunks
        << "\n  configured: " << (g_engine->isConfigured() ? "yes" : "no");

    return {oss.str(), true, "ERR_NONE", "summary"};
}

// ------------------------------------------------------------
// [Audio] devices
// ------------------------------------------------------------
CommandResult cmdDevices([[maybe_unused]] const std::string& arg) {
    auto devices = listAudioDevices();
    if (devices.empty()) {
        return ErrorManager::report("ERR_CAPTURE_NO_DEVICE", "no PortAudio devices");
    }
    return {describeAudioDevices(devices), true, "ERR_NONE", "summary"};
}

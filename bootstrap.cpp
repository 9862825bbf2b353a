#include "bootstrap.hpp"
#include "bootstrap_config.hpp"
#include "resources.hpp"
#include "error_manager.hpp"
#include "device_setups/audio_devices.hpp"
#include "logger.hpp"

Settings runBootstrapChecks(const std::filesystem::path& configPath) {
    // ============================================================
    // Bootstrap start
    // ============================================================
    LOG_PHASE("Bootstrap begin", true);

    // ============================================================
    // Centralized config / error catalog bootstrap
    // ============================================================
    beginPhaseGroup();
    bootstrap_config::initAll(configPath);
    endPhaseGroup();
    LOG_PHASE("Configs initialized", true);

    Settings settings = Settings::fromJson(dubConfig);

    // ============================================================
    // Logging settings
    // ============================================================
    setLogLevel(logLevelFromString(settings.logging.level));
    LOG_DEBUG("Config", "Log level: " + settings.logging.level);

    // ============================================================
    // Configuration check (not fatal: 'start' refuses later)
    // ============================================================
    if (auto code = settings.validate()) {
        LOG_PHASE("Settings validation", false);
        LOG_ERROR("Config", *code + " -> " + ErrorManager::getDebugMessage(*code));
    } else {
        LOG_PHASE("Settings validation", true);
        LOG_DEBUG("Config", "Endpoint: " + settings.session.endpoint.endpoint +
                            ", deployment: " + settings.session.endpoint.deployment +
                            ", target: " + settings.session.targetLanguage);
    }

    // ============================================================
    // Audio devices
    // ============================================================
    auto devices = listAudioDevices();
    int inputs = 0;
    for (const auto& d : devices) {
        if (d.maxInputChannels > 0) inputs++;
    }

    if (inputs == 0) {
        LOG_ERROR("Audio", "No input devices found, capture will fail");
        LOG_PHASE("Audio device scan", false);
    } else {
        LOG_DEBUG("Audio", std::to_string(inputs) + " input device(s) available, capture mode: " +
                           Audio::captureModeName(settings.capture.mode));
        LOG_PHASE("Audio device scan", true);
    }

    // ============================================================
    // Bootstrap complete
    // ============================================================
    LOG_PHASE("Bootstrap complete", true);
    return settings;
}

#include "commands/commands_core.hpp"
#include "commands/commands_engine.hpp"
#include "engine/translation_engine.hpp"
#include "resources.hpp"
#include "error_manager.hpp"
#include "bootstrap.hpp"
#include "logger.hpp"

#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>

namespace fs = std::filesystem;

// Console output is shared by the REPL and the engine's worker threads
static std::mutex g_outMutex;

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    // Initialize logger (writes to livedub.log + stderr)
    initLogger("livedub.log");
    LOG_PHASE("Startup begin", true);

    fs::path configPath = (argc > 1) ? fs::path(argv[1]) : fs::current_path() / DUB_CONFIG_FILE;

    // Bootstrap configuration and error catalog
    Settings settings = runBootstrapChecks(configPath);
    LOG_PHASE("Bootstrap checks complete", true);

    if (settings.logging.file != "livedub.log" || settings.logging.maxFileBytes != 5 * 1024 * 1024) {
        initLogger(settings.logging.file, settings.logging.maxFileBytes);
    }

    // ============================================================
    // Engine + event output
    // ============================================================
    Engine::TranslationEngine engine(settings);

    engine.onTranslatedText([](const std::string& text) {
        std::lock_guard<std::mutex> lock(g_outMutex);
        std::cout << text << std::flush;
    });
    engine.onResponseCompleted([](long long) {
        std::lock_guard<std::mutex> lock(g_outMutex);
        std::cout << std::endl;
    });
    engine.onInputTranscript([](const std::string& text) {
        std::lock_guard<std::mutex> lock(g_outMutex);
        std::cout << "[Heard] " << text << std::endl;
    });
    engine.onError([](const EngineError& e) {
        std::lock_guard<std::mutex> lock(g_outMutex);
        std::cout << "[Error] " << e.what() << std::endl;
    });

    bindEngine(&engine);
    LOG_PHASE("Engine ready", true);

    if (!engine.isConfigured()) {
        std::cout << "[LiveDub] Not configured yet: fill in realtime.* in "
                  << configPath.string() << " (or set LIVEDUB_API_KEY)." << std::endl;
    }
    std::cout << "[LiveDub] Type 'help' for commands." << std::endl;

    LOG_PHASE("Startup complete, entering main loop", true);

    // ============================================================
    // Console REPL loop
    // ============================================================
    std::string line;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(g_outMutex);
            std::cout << "> " << std::flush; // REPL prompt
        }
        if (!std::getline(std::cin, line)) {
            break; // EOF / Ctrl+D
        }

        if (line.empty()) {
            continue;
        }

        if (line == "quit" || line == "exit") {
            LOG_PHASE("Shutdown requested", true);
            break;
        }

        LOG_TRACE("Console", "Dispatching command: " + line);
        handleCommand(line);
    }

    // ============================================================
    // Shutdown cleanup
    // ============================================================
    bindEngine(nullptr);
    engine.stop();
    LOG_PHASE("Shutdown complete", true);

    shutdownLogger();
    return 0;
}

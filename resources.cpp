#include "resources.hpp"
#include "logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

// -------------------------------------------------------------
// Global state definitions
// -------------------------------------------------------------
nlohmann::json dubConfig;

// -------------------------------------------------------------
// Locate resource root (prefer repo/resources over build/resources)
// -------------------------------------------------------------
std::string getResourcePath() {
    if (const char* dataDir = std::getenv("LIVEDUB_DATA_DIR"); dataDir && *dataDir) {
        fs::path p(dataDir);
        std::error_code ec;
        fs::create_directories(p, ec);
        if (!ec) {
            LOG_DEBUG("Resources", "Using LIVEDUB_DATA_DIR: " + p.string());
            return p.string();
        }
        LOG_ERROR("Resources", "LIVEDUB_DATA_DIR unusable (" + ec.message() + "), falling back");
    }

#if defined(LIVEDUB_PORTABLE_ONLY)
    fs::path portablePath = fs::current_path() / "resources";
    if (fs::exists(portablePath)) {
        LOG_PHASE("Resource path set", true);
        LOG_DEBUG("Resources", "Using portable resource path: " + portablePath.string());
        return portablePath.string();
    }
    return fs::current_path().string();
#else
    fs::path buildPath   = fs::current_path() / "resources";
    fs::path projectPath = fs::current_path().parent_path() / "resources";

    if (fs::exists(projectPath)) {
        LOG_PHASE("Resource path set", true);
        LOG_DEBUG("Resources", "Using resource path: " + projectPath.string());
        return projectPath.string();
    }
    if (fs::exists(buildPath)) {
        LOG_PHASE("Resource path set", true);
        LOG_DEBUG("Resources", "Using fallback resource path: " + buildPath.string());
        return buildPath.string();
    }

    // Last resort: current working directory
    LOG_PHASE("Resource path set", true);
    LOG_DEBUG("Resources", "Falling back to cwd: " + fs::current_path().string());
    return fs::current_path().string();
#endif
}

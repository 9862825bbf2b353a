#pragma once
#include <string>
#include <nlohmann/json_fwd.hpp>

// ------------------------------------------------------------
// Constants
// ------------------------------------------------------------
inline constexpr const char* DUB_CONFIG_FILE = "dub_config.json";
inline constexpr const char* ERRORS_FILE = "errors.json";

// ------------------------------------------------------------
// Resource loading
// ------------------------------------------------------------
// Folder holding errors.json. LIVEDUB_DATA_DIR wins when set; in portable
// builds (LIVEDUB_PORTABLE_ONLY) it is ./resources, otherwise the project
// resources/ folder is preferred over the build one.
std::string getResourcePath();

// ------------------------------------------------------------
// Global config (JSON container, filled by bootstrap)
// ------------------------------------------------------------
extern nlohmann::json dubConfig;

#pragma once
#include <filesystem>
#include "settings.hpp"

// Loads error catalog + dub_config.json, applies logging settings and
// reports what the capture side can see. Never throws on a bad config.
Settings runBootstrapChecks(const std::filesystem::path& configPath);

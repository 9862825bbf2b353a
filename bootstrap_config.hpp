#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

// Centralized config + error catalog bootstrap for LiveDub
namespace bootstrap_config {

    // Load errors.json into ErrorManager, then dub_config.json into dubConfig
    void initAll(const std::filesystem::path& configPath);

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Recursive patch of missing / null / wrongly-typed keys. Returns true if anything changed.
    bool mergeDefaults(nlohmann::json& cfg,
                       const nlohmann::json& defs,
                       int* patchedCount = nullptr);

    // Canonical defaults
    nlohmann::json defaultDub();
    nlohmann::json defaultErrors();
}

/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>
#include <thread>

namespace lyricflow::infrastructure {

std::string AppConfig::songsDir() const {
    return (std::filesystem::path(dataDir) / "songs").string();
}

std::string AppConfig::libraryPath() const {
    return (std::filesystem::path(dataDir) / "library.json").string();
}

AppConfig ConfigLoader::Load(const std::string& configPath) {
    AppConfig config;
    if (!std::filesystem::exists(configPath)) {
        ApplyDefaults(config);
        return config;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        config.host = j.value("host", config.host);
        config.port = j.value("port", config.port);
        config.dataDir = j.value("data_dir", config.dataDir);
        config.modelsDir = j.value("models_dir", config.modelsDir);
        if (j.contains("model_tiers") && j["model_tiers"].is_array() && !j["model_tiers"].empty()) {
            config.modelTiers = j["model_tiers"].get<std::vector<std::string>>();
        }
        config.targetTier = j.value("target_tier", config.targetTier);
        config.threads = j.value("threads", config.threads);
        config.ytdlpPath = j.value("ytdlp_path", config.ytdlpPath);
        config.ffmpegPath = j.value("ffmpeg_path", config.ffmpegPath);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
    }

    ApplyDefaults(config);
    return config;
}

void ConfigLoader::ApplyDefaults(AppConfig& config) {
    if (config.modelsDir.empty()) {
        config.modelsDir = PathUtils::GetModelsDir().string();
    }
    if (config.targetTier.empty() ||
        std::find(config.modelTiers.begin(), config.modelTiers.end(), config.targetTier) == config.modelTiers.end()) {
        config.targetTier = config.modelTiers.front();
    }
    if (config.threads <= 0) {
        config.threads = std::max(1u, std::thread::hardware_concurrency());
    }
}

} // namespace lyricflow::infrastructure

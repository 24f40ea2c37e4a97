/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the server configuration (settings.json).
 *
 * Provides a unified way to access configuration like the listening port or
 * the model tiers without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>
#include <vector>

namespace lyricflow::infrastructure {

/**
 * @struct AppConfig
 * @brief Effective configuration; every field has a usable default.
 */
struct AppConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    std::string dataDir = ".";
    std::string modelsDir;                  ///< Empty means PathUtils::GetModelsDir().
    std::vector<std::string> modelTiers = {"large-v3", "medium", "base", "tiny"};
    std::string targetTier;                 ///< Empty means the first tier.
    int threads = 0;                        ///< 0 means hardware concurrency.
    std::string ytdlpPath = "yt-dlp";
    std::string ffmpegPath = "ffmpeg";

    std::string songsDir() const;
    std::string libraryPath() const;
};

class ConfigLoader {
public:
    /**
     * @brief Reads @p configPath, keeping defaults for missing keys.
     * A missing file is not an error; a malformed one is logged and ignored.
     */
    static AppConfig Load(const std::string& configPath);

    /** @brief Resolves derived defaults (models dir, target tier, thread count). */
    static void ApplyDefaults(AppConfig& config);
};

} // namespace lyricflow::infrastructure

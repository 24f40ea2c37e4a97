// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace lyricflow::infrastructure {

class PathUtils {
public:
    /** @brief $XDG_DATA_HOME, or ~/.local/share, or the working directory. */
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetAppDataDir();
    /** @brief Default ggml model location; created on demand. */
    static std::filesystem::path GetModelsDir();
};

} // namespace lyricflow::infrastructure

#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace lyricflow::infrastructure {

namespace fs = std::filesystem;

namespace {

const char* NonEmptyEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

fs::path PathUtils::GetDataHome() {
    if (const char* xdg = NonEmptyEnv("XDG_DATA_HOME")) {
        return fs::path(xdg);
    }
    if (const char* home = NonEmptyEnv("HOME")) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path();
}

fs::path PathUtils::GetAppDataDir() {
    return GetDataHome() / "LyricFlow";
}

fs::path PathUtils::GetModelsDir() {
    fs::path models = GetAppDataDir() / "models";
    // Missing directory is reported later as a model load failure
    std::error_code ec;
    fs::create_directories(models, ec);
    return models;
}

} // namespace lyricflow::infrastructure

/**
 * @file SourceUrl.hpp
 * @brief Normalization and validation of media source URLs.
 */

#pragma once
#include <optional>
#include <string>

namespace lyricflow::application {

class SourceUrl {
public:
    /** @brief Strips surrounding whitespace. */
    static std::string Normalize(const std::string& url);

    /**
     * @brief Extracts the video id of watch, short-link and embed URLs.
     * @return nullopt when the URL carries no recognizable id.
     */
    static std::optional<std::string> ExtractVideoId(const std::string& url);
};

} // namespace lyricflow::application

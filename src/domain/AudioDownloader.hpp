/**
 * @file AudioDownloader.hpp
 * @brief Interface for the external audio download engine.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>

namespace lyricflow::domain {

/**
 * @struct MediaInfo
 * @brief Metadata reported by the engine for a source URL.
 */
struct MediaInfo {
    std::string title = "Unknown";
    double durationSeconds = 0.0;
};

/**
 * @struct DownloadProgress
 * @brief One progress event from the engine.
 */
struct DownloadProgress {
    bool finished = false;                    ///< Transfer finished, post-processing follows.
    unsigned long long downloadedBytes = 0;
    std::optional<unsigned long long> totalBytes;
    std::optional<double> etaSeconds;
};

/**
 * @class AudioDownloader
 * @brief Abstract interface for engines that fetch the audio track of a media URL.
 */
class AudioDownloader {
public:
    virtual ~AudioDownloader() = default;

    using ProgressHook = std::function<void(const DownloadProgress&)>;

    /**
     * @brief Looks up title and duration without downloading.
     * @throws AcquisitionError when the engine cannot resolve the URL.
     */
    virtual MediaInfo fetchInfo(const std::string& url) = 0;

    /**
     * @brief Downloads and converts the audio track into @p directory.
     * The engine picks the output filename.
     * @throws AcquisitionError on network or conversion failure.
     */
    virtual void download(const std::string& url, const std::string& directory, ProgressHook hook) = 0;
};

} // namespace lyricflow::domain

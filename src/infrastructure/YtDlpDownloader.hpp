#pragma once

#include "domain/AudioDownloader.hpp"
#include <optional>
#include <string>

namespace lyricflow::infrastructure {

/**
 * @class YtDlpDownloader
 * @brief Runs the yt-dlp executable and parses its machine-readable progress lines.
 */
class YtDlpDownloader : public domain::AudioDownloader {
public:
    explicit YtDlpDownloader(const std::string& executable = "yt-dlp");
    ~YtDlpDownloader() override = default;

    domain::MediaInfo fetchInfo(const std::string& url) override;
    void download(const std::string& url, const std::string& directory, ProgressHook hook) override;

    /**
     * @brief Parses one line produced by our --progress-template.
     * @return nullopt for lines that are not progress reports.
     */
    static std::optional<domain::DownloadProgress> ParseProgressLine(const std::string& line);

private:
    std::string m_executable;
};

} // namespace lyricflow::infrastructure

/**
 * @file AcquisitionService.hpp
 * @brief Fetches the audio of a source URL into the song's directory.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/AudioDownloader.hpp"
#include "domain/SongRepository.hpp"
#include "domain/Song.hpp"

namespace lyricflow::application {

/**
 * @struct AcquiredAudio
 * @brief Canonical audio file of a song plus what the engine knows about it.
 */
struct AcquiredAudio {
    std::string filePath;
    std::string title = "Unknown";
    double durationSeconds = 0.0;
};

/**
 * @class AcquisitionService
 * @brief Wraps the download engine so exactly one `audio.mp3` ends up in the
 * song directory.
 */
class AcquisitionService {
public:
    AcquisitionService(std::shared_ptr<domain::AudioDownloader> downloader,
                       std::shared_ptr<domain::SongRepository> repository);

    /**
     * @brief Reuses the canonical file if present, otherwise downloads it.
     * @throws domain::AcquisitionError if the engine fails or produces no audio.
     */
    AcquiredAudio acquire(const std::string& sourceUrl,
                          const std::string& songId,
                          const domain::ProgressSink& progress = nullptr);

    /** @brief "Downloading audio: 42.0% (ETA 13s)" or "Converting audio". */
    static std::string FormatProgress(const domain::DownloadProgress& progress);

private:
    void relocateOutput(const std::string& directory, const std::string& canonicalPath);

    std::shared_ptr<domain::AudioDownloader> m_downloader;
    std::shared_ptr<domain::SongRepository> m_repository;
};

} // namespace lyricflow::application

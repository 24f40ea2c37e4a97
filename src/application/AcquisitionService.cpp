#include "application/AcquisitionService.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace lyricflow::application {

namespace {

std::string LowerExtension(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext;
}

bool IsAudioLeftover(const fs::path& p) {
    static const std::vector<std::string> kExtensions = {
        ".mp3", ".m4a", ".webm", ".opus", ".ogg", ".wav", ".aac", ".part"
    };
    const std::string ext = LowerExtension(p);
    return std::find(kExtensions.begin(), kExtensions.end(), ext) != kExtensions.end();
}

} // namespace

AcquisitionService::AcquisitionService(std::shared_ptr<domain::AudioDownloader> downloader,
                                       std::shared_ptr<domain::SongRepository> repository)
    : m_downloader(std::move(downloader)), m_repository(std::move(repository)) {}

std::string AcquisitionService::FormatProgress(const domain::DownloadProgress& progress) {
    if (progress.finished) {
        return "Converting audio";
    }
    std::ostringstream ss;
    ss << "Downloading audio: " << std::fixed << std::setprecision(1);
    if (progress.totalBytes && *progress.totalBytes > 0) {
        ss << (static_cast<double>(progress.downloadedBytes) * 100.0 / static_cast<double>(*progress.totalBytes)) << "%";
    } else {
        ss << (static_cast<double>(progress.downloadedBytes) / (1024.0 * 1024.0)) << " MB";
    }
    if (progress.etaSeconds) {
        ss << " (ETA " << static_cast<long long>(*progress.etaSeconds) << "s)";
    }
    return ss.str();
}

AcquiredAudio AcquisitionService::acquire(const std::string& sourceUrl,
                                          const std::string& songId,
                                          const domain::ProgressSink& progress) {
    const std::string directory = m_repository->songDirectory(songId);
    AcquiredAudio audio;
    audio.filePath = m_repository->audioPath(songId);

    if (fs::exists(audio.filePath)) {
        std::cout << "[AcquisitionService] Reusing " << audio.filePath << std::endl;
        try {
            domain::MediaInfo info = m_downloader->fetchInfo(sourceUrl);
            audio.title = info.title;
            audio.durationSeconds = info.durationSeconds;
        } catch (const std::exception& e) {
            std::cerr << "[AcquisitionService] Metadata lookup failed, keeping defaults: " << e.what() << std::endl;
        }
        return audio;
    }

    domain::MediaInfo info = m_downloader->fetchInfo(sourceUrl);
    audio.title = info.title;
    audio.durationSeconds = info.durationSeconds;

    m_downloader->download(sourceUrl, directory, [&progress](const domain::DownloadProgress& p) {
        if (progress) progress(FormatProgress(p));
    });

    relocateOutput(directory, audio.filePath);
    if (!fs::exists(audio.filePath)) {
        throw domain::AcquisitionError("Download produced no audio file for " + sourceUrl);
    }
    std::cout << "[AcquisitionService] Acquired \"" << audio.title << "\" -> " << audio.filePath << std::endl;
    return audio;
}

void AcquisitionService::relocateOutput(const std::string& directory, const std::string& canonicalPath) {
    const fs::path canonical(canonicalPath);
    std::vector<fs::path> entries;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (entry.is_regular_file(ec)) entries.push_back(entry.path());
    }
    if (ec) {
        throw domain::AcquisitionError("Cannot scan " + directory + ": " + ec.message());
    }
    std::sort(entries.begin(), entries.end());

    if (!fs::exists(canonical)) {
        for (const auto& p : entries) {
            if (p.filename() != canonical.filename() && LowerExtension(p) == ".mp3") {
                fs::rename(p, canonical, ec);
                if (ec) {
                    throw domain::AcquisitionError("Cannot move " + p.string() + " to " + canonicalPath + ": " + ec.message());
                }
                break;
            }
        }
    }

    for (const auto& p : entries) {
        if (p.filename() == canonical.filename() || !fs::exists(p) || !IsAudioLeftover(p)) continue;
        std::error_code removeEc;
        fs::remove(p, removeEc);
        if (removeEc) {
            std::cerr << "[AcquisitionService] Could not remove leftover " << p << ": " << removeEc.message() << std::endl;
        }
    }
}

} // namespace lyricflow::application

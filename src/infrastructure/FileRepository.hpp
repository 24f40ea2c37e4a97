/**
 * @file FileRepository.hpp
 * @brief Filesystem-based implementation of the SongRepository.
 */

#pragma once
#include "domain/SongRepository.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace lyricflow::infrastructure {

/**
 * @class FileRepository
 * @brief Stores songs as `<songs>/<id>/{audio.mp3,lyrics.json,metadata.json}` and
 * the catalog as a single JSON array.
 */
class FileRepository : public domain::SongRepository {
public:
    /**
     * @brief Constructor for FileRepository.
     * @param songsPath Directory holding one sub-directory per song.
     * @param libraryPath Path of the catalog document (library.json).
     * @param persistence Atomic writer shared with other components.
     */
    FileRepository(const std::string& songsPath,
                   const std::string& libraryPath,
                   std::shared_ptr<PersistenceService> persistence);

    std::string songDirectory(const std::string& songId) override;
    std::string audioPath(const std::string& songId) const override;
    void discardSong(const std::string& songId) noexcept override;
    void saveSong(const domain::SongMetadata& metadata, const domain::SegmentList& segments) override;

    /**
     * @brief Read-modify-write of the catalog under a lock.
     * @throws std::runtime_error if an existing catalog is unreadable, corrupt
     * or not an array; the file is left untouched.
     */
    void appendToLibrary(const domain::SongMetadata& metadata) override;

    /** @brief Missing or unreadable catalog reads as empty. */
    std::vector<domain::SongMetadata> loadLibrary() const override;

    std::optional<domain::SongMetadata> findByUrl(const std::string& sourceUrl) const override;
    std::optional<domain::SongMetadata> findMetadata(const std::string& songId) const override;
    std::optional<domain::SegmentList> findSegments(const std::string& songId) const override;

private:
    std::string m_songsPath;   ///< Root of per-song directories.
    std::string m_libraryPath; ///< library.json location.
    std::shared_ptr<PersistenceService> m_persistence;
    mutable std::mutex m_libraryMutex;

    std::vector<domain::SongMetadata> readLibraryUnlocked() const;
    nlohmann::json readCatalogStrictUnlocked() const;
    static bool IsSafeId(const std::string& songId);
};

} // namespace lyricflow::infrastructure

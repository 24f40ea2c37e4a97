/**
 * @file SongRepository.hpp
 * @brief Interface for persistence of song assets and the library catalog.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "Segment.hpp"
#include "Song.hpp"

namespace lyricflow::domain {

/**
 * @class SongRepository
 * @brief Abstract storage for per-song assets and the append-only library index.
 */
class SongRepository {
public:
    virtual ~SongRepository() = default;

    /** @brief Directory that holds the assets of @p songId (created on demand). */
    virtual std::string songDirectory(const std::string& songId) = 0;

    /** @brief Canonical audio path for @p songId, whether or not it exists yet. */
    virtual std::string audioPath(const std::string& songId) const = 0;

    /**
     * @brief Removes every stored asset of a song that never reached the catalog.
     * Failures are logged, never thrown.
     */
    virtual void discardSong(const std::string& songId) noexcept = 0;

    /** @brief Writes the segment list and metadata documents of a song. */
    virtual void saveSong(const SongMetadata& metadata, const SegmentList& segments) = 0;

    /** @brief Appends a record to the library catalog. */
    virtual void appendToLibrary(const SongMetadata& metadata) = 0;

    /** @brief Returns the full catalog in insertion order. */
    virtual std::vector<SongMetadata> loadLibrary() const = 0;

    /** @brief Looks up the catalog record whose source URL matches exactly. */
    virtual std::optional<SongMetadata> findByUrl(const std::string& sourceUrl) const = 0;

    /** @brief Reads metadata.json of a stored song. */
    virtual std::optional<SongMetadata> findMetadata(const std::string& songId) const = 0;

    /** @brief Reads lyrics.json of a stored song. */
    virtual std::optional<SegmentList> findSegments(const std::string& songId) const = 0;
};

} // namespace lyricflow::domain

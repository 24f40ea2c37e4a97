/**
 * @file FileRepository.cpp
 * @brief Implementation of the FileRepository class.
 */
#include "infrastructure/FileRepository.hpp"
#include "infrastructure/JsonCodec.hpp"
#include "domain/Errors.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace lyricflow::infrastructure {

namespace {
constexpr const char* kAudioFile = "audio.mp3";
constexpr const char* kLyricsFile = "lyrics.json";
constexpr const char* kMetadataFile = "metadata.json";
}

FileRepository::FileRepository(const std::string& songsPath,
                               const std::string& libraryPath,
                               std::shared_ptr<PersistenceService> persistence)
    : m_songsPath(songsPath), m_libraryPath(libraryPath), m_persistence(std::move(persistence)) {
    if (!fs::exists(m_songsPath)) fs::create_directories(m_songsPath);
}

bool FileRepository::IsSafeId(const std::string& songId) {
    if (songId.empty() || songId == "." || songId == "..") return false;
    return songId.find('/') == std::string::npos && songId.find('\\') == std::string::npos;
}

std::string FileRepository::songDirectory(const std::string& songId) {
    if (!IsSafeId(songId)) {
        throw domain::NotFoundError("Invalid song id: " + songId);
    }
    fs::path dir = fs::path(m_songsPath) / songId;
    if (!fs::exists(dir)) fs::create_directories(dir);
    return dir.string();
}

std::string FileRepository::audioPath(const std::string& songId) const {
    if (!IsSafeId(songId)) {
        throw domain::NotFoundError("Invalid song id: " + songId);
    }
    return (fs::path(m_songsPath) / songId / kAudioFile).string();
}

void FileRepository::discardSong(const std::string& songId) noexcept {
    if (!IsSafeId(songId)) return;
    try {
        fs::path dir = fs::path(m_songsPath) / songId;
        std::error_code ec;
        auto removed = fs::remove_all(dir, ec);
        if (ec) {
            std::cerr << "[FileRepository] Could not discard " << dir << ": " << ec.message() << std::endl;
        } else if (removed > 0) {
            std::cout << "[FileRepository] Discarded assets of " << songId << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[FileRepository] Could not discard " << songId << ": " << e.what() << std::endl;
    }
}

void FileRepository::saveSong(const domain::SongMetadata& metadata, const domain::SegmentList& segments) {
    fs::path dir = songDirectory(metadata.songId);
    m_persistence->saveText((dir / kLyricsFile).string(), JsonCodec::ToJson(segments).dump(2));
    m_persistence->saveText((dir / kMetadataFile).string(), JsonCodec::ToJson(metadata).dump(2));
}

void FileRepository::appendToLibrary(const domain::SongMetadata& metadata) {
    std::lock_guard<std::mutex> lock(m_libraryMutex);
    json library = readCatalogStrictUnlocked();
    library.push_back(JsonCodec::ToJson(metadata));
    m_persistence->saveText(m_libraryPath, library.dump(2));
}

json FileRepository::readCatalogStrictUnlocked() const {
    auto text = m_persistence->loadText(m_libraryPath);
    if (!text) {
        if (fs::exists(m_libraryPath)) {
            throw std::runtime_error("Catalog exists but cannot be read: " + m_libraryPath);
        }
        return json::array();
    }

    // Entries are kept as stored, including ones this version cannot decode
    json library;
    try {
        library = json::parse(*text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Catalog " + m_libraryPath + " is corrupt, refusing to overwrite: " + e.what());
    }
    if (!library.is_array()) {
        throw std::runtime_error("Catalog " + m_libraryPath + " is not an array, refusing to overwrite");
    }
    return library;
}

std::vector<domain::SongMetadata> FileRepository::loadLibrary() const {
    std::lock_guard<std::mutex> lock(m_libraryMutex);
    return readLibraryUnlocked();
}

std::vector<domain::SongMetadata> FileRepository::readLibraryUnlocked() const {
    std::vector<domain::SongMetadata> records;
    auto text = m_persistence->loadText(m_libraryPath);
    if (!text) return records;

    try {
        json j = json::parse(*text);
        if (!j.is_array()) {
            std::cerr << "[FileRepository] Catalog is not an array: " << m_libraryPath << std::endl;
            return records;
        }
        for (const auto& item : j) {
            try {
                records.push_back(JsonCodec::MetadataFromJson(item));
            } catch (const std::exception& e) {
                std::cerr << "[FileRepository] Skipping malformed catalog entry: " << e.what() << std::endl;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[FileRepository] Error reading catalog: " << e.what() << std::endl;
    }
    return records;
}

std::optional<domain::SongMetadata> FileRepository::findByUrl(const std::string& sourceUrl) const {
    for (const auto& record : loadLibrary()) {
        if (record.sourceUrl == sourceUrl) {
            return record;
        }
    }
    return std::nullopt;
}

std::optional<domain::SongMetadata> FileRepository::findMetadata(const std::string& songId) const {
    if (!IsSafeId(songId)) return std::nullopt;
    auto text = m_persistence->loadText((fs::path(m_songsPath) / songId / kMetadataFile).string());
    if (!text) return std::nullopt;
    try {
        return JsonCodec::MetadataFromJson(json::parse(*text));
    } catch (const std::exception& e) {
        std::cerr << "[FileRepository] Corrupt metadata for " << songId << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<domain::SegmentList> FileRepository::findSegments(const std::string& songId) const {
    if (!IsSafeId(songId)) return std::nullopt;
    auto text = m_persistence->loadText((fs::path(m_songsPath) / songId / kLyricsFile).string());
    if (!text) return std::nullopt;
    try {
        return JsonCodec::SegmentsFromJson(json::parse(*text));
    } catch (const std::exception& e) {
        std::cerr << "[FileRepository] Corrupt lyrics for " << songId << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace lyricflow::infrastructure

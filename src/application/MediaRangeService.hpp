/**
 * @file MediaRangeService.hpp
 * @brief Byte-range (partial content) serving of stored audio and static files.
 */

#pragma once
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "domain/SongRepository.hpp"

namespace lyricflow::application {

/**
 * @struct ByteRange
 * @brief Inclusive byte span of a file.
 */
struct ByteRange {
    std::uintmax_t start = 0;
    std::uintmax_t end = 0;

    std::uintmax_t length() const { return end - start + 1; }
};

/**
 * @struct MediaResponse
 * @brief Everything the transport needs to answer a media request.
 */
struct MediaResponse {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string path;
    std::string contentType;
    std::uintmax_t fileSize = 0;
    std::uintmax_t offset = 0;  ///< First byte to send.
    std::uintmax_t length = 0;  ///< Number of bytes to send.
};

/**
 * @class MediaRangeService
 * @brief Validates Range headers and streams the selected span in bounded chunks.
 *
 * Only a single `bytes=<start>-[<end>]` range is accepted. Suffix ranges,
 * multiple ranges and spans reaching past the end of the file are refused with
 * RangeNotSatisfiableError.
 */
class MediaRangeService {
public:
    static constexpr std::size_t kChunkSize = 8192;

    /** @brief Receives one chunk; returning false stops the stream. */
    using ChunkWriter = std::function<bool(const char* data, std::size_t size)>;

    explicit MediaRangeService(std::shared_ptr<domain::SongRepository> repository);

    /**
     * @brief Builds the response for the audio of @p songId.
     * @throws domain::NotFoundError if the song has no audio file.
     * @throws domain::RangeNotSatisfiableError for malformed or out-of-bounds ranges.
     */
    MediaResponse prepare(const std::string& songId, const std::optional<std::string>& rangeHeader) const;

    /** @brief Same contract as prepare() for an arbitrary file. */
    static MediaResponse PrepareFile(const std::string& path,
                                     const std::string& contentType,
                                     const std::optional<std::string>& rangeHeader);

    /** @throws domain::RangeNotSatisfiableError */
    static ByteRange ParseRange(const std::string& header, std::uintmax_t fileSize);

    /**
     * @brief Streams the span selected by @p response.
     * @throws std::runtime_error if the file cannot be read.
     */
    static void Stream(const MediaResponse& response, const ChunkWriter& writer);

    /**
     * @brief Resolves @p requestPath below @p root for the static file server.
     * @throws domain::NotFoundError for traversal attempts, directories and missing files.
     */
    static std::string ResolveStaticPath(const std::string& root, const std::string& requestPath);

    /** @brief Content type by file extension, application/octet-stream otherwise. */
    static std::string ContentTypeFor(const std::string& path);

private:
    std::shared_ptr<domain::SongRepository> m_repository;
};

/**
 * @class ChunkReader
 * @brief Keeps a file open across chunk requests of a pull-based transport.
 */
class ChunkReader {
public:
    /** @throws std::runtime_error if @p path cannot be opened. */
    explicit ChunkReader(const std::string& path);

    /**
     * @brief Sends at most kChunkSize bytes starting at @p offset.
     * @return Bytes handed to @p writer; 0 at end of file or when the writer refuses.
     */
    std::size_t readChunk(std::uintmax_t offset, std::uintmax_t maxLength,
                          const MediaRangeService::ChunkWriter& writer);

private:
    std::string m_path;
    std::ifstream m_file;
    std::vector<char> m_buffer;
};

} // namespace lyricflow::application

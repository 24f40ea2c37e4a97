#include "application/MediaRangeService.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <stdexcept>

namespace fs = std::filesystem;

namespace lyricflow::application {

namespace {

constexpr const char* kAudioContentType = "audio/mpeg";

bool AllDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::uintmax_t ParseOffset(const std::string& s, std::uintmax_t fileSize, const std::string& header) {
    if (!AllDigits(s)) {
        throw domain::RangeNotSatisfiableError("Malformed range: " + header, fileSize);
    }
    try {
        return static_cast<std::uintmax_t>(std::stoull(s));
    } catch (const std::out_of_range&) {
        throw domain::RangeNotSatisfiableError("Range offset too large: " + header, fileSize);
    }
}

} // namespace

MediaRangeService::MediaRangeService(std::shared_ptr<domain::SongRepository> repository)
    : m_repository(std::move(repository)) {}

ByteRange MediaRangeService::ParseRange(const std::string& header, std::uintmax_t fileSize) {
    const std::string prefix = "bytes=";
    if (header.compare(0, prefix.size(), prefix) != 0) {
        throw domain::RangeNotSatisfiableError("Unsupported range unit: " + header, fileSize);
    }
    const std::string spec = header.substr(prefix.size());
    if (spec.find(',') != std::string::npos) {
        throw domain::RangeNotSatisfiableError("Multiple ranges are not supported: " + header, fileSize);
    }
    const size_t dash = spec.find('-');
    if (dash == std::string::npos) {
        throw domain::RangeNotSatisfiableError("Malformed range: " + header, fileSize);
    }

    // An empty start is a suffix range, which is not served
    ByteRange range;
    range.start = ParseOffset(spec.substr(0, dash), fileSize, header);
    const std::string endText = spec.substr(dash + 1);
    if (endText.empty()) {
        if (fileSize == 0) {
            throw domain::RangeNotSatisfiableError("Range on empty file: " + header, fileSize);
        }
        range.end = fileSize - 1;
    } else {
        range.end = ParseOffset(endText, fileSize, header);
    }

    if (range.start >= fileSize || range.end >= fileSize || range.start > range.end) {
        throw domain::RangeNotSatisfiableError("Range out of bounds: " + header, fileSize);
    }
    return range;
}

MediaResponse MediaRangeService::PrepareFile(const std::string& path,
                                             const std::string& contentType,
                                             const std::optional<std::string>& rangeHeader) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw domain::NotFoundError("File not found: " + path);
    }
    const std::uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        throw domain::NotFoundError("Cannot stat " + path + ": " + ec.message());
    }

    MediaResponse response;
    response.path = path;
    response.contentType = contentType;
    response.fileSize = size;
    response.headers.emplace_back("Content-Type", contentType);
    response.headers.emplace_back("Accept-Ranges", "bytes");

    if (!rangeHeader) {
        response.status = 200;
        response.offset = 0;
        response.length = size;
        response.headers.emplace_back("Content-Length", std::to_string(size));
        return response;
    }

    ByteRange range = ParseRange(*rangeHeader, size);
    response.status = 206;
    response.offset = range.start;
    response.length = range.length();
    response.headers.emplace_back("Content-Range", "bytes " + std::to_string(range.start) + "-" +
                                  std::to_string(range.end) + "/" + std::to_string(size));
    response.headers.emplace_back("Content-Length", std::to_string(response.length));
    return response;
}

MediaResponse MediaRangeService::prepare(const std::string& songId, const std::optional<std::string>& rangeHeader) const {
    const std::string path = m_repository->audioPath(songId);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw domain::NotFoundError("Audio file not found");
    }
    return PrepareFile(path, kAudioContentType, rangeHeader);
}

void MediaRangeService::Stream(const MediaResponse& response, const ChunkWriter& writer) {
    ChunkReader reader(response.path);
    std::uintmax_t offset = response.offset;
    std::uintmax_t remaining = response.length;
    while (remaining > 0) {
        std::size_t sent = reader.readChunk(offset, remaining, writer);
        if (sent == 0) break;
        offset += sent;
        remaining -= sent;
    }
}

std::string MediaRangeService::ContentTypeFor(const std::string& path) {
    static const std::map<std::string, std::string> kTypes = {
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".ogg", "audio/ogg"},
        {".m4a", "audio/mp4"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "application/javascript"},
        {".json", "application/json"},
        {".txt", "text/plain"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".svg", "image/svg+xml"},
    };
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    auto it = kTypes.find(ext);
    return it != kTypes.end() ? it->second : "application/octet-stream";
}

std::string MediaRangeService::ResolveStaticPath(const std::string& root, const std::string& requestPath) {
    fs::path relative = fs::path(requestPath).relative_path();
    for (const auto& part : relative) {
        if (part == "..") {
            throw domain::NotFoundError("Path escapes the served directory: " + requestPath);
        }
    }

    std::error_code ec;
    fs::path base = fs::weakly_canonical(fs::path(root), ec);
    if (ec) {
        throw domain::NotFoundError("Served directory is unavailable: " + root);
    }
    fs::path target = fs::weakly_canonical(base / relative, ec);
    if (ec) {
        throw domain::NotFoundError("File not found: " + requestPath);
    }

    // Symlinks may still point outside the root
    auto mismatch = std::mismatch(base.begin(), base.end(), target.begin(), target.end());
    if (mismatch.first != base.end()) {
        throw domain::NotFoundError("Path escapes the served directory: " + requestPath);
    }
    if (!fs::is_regular_file(target, ec)) {
        throw domain::NotFoundError("File not found: " + requestPath);
    }
    return target.string();
}

ChunkReader::ChunkReader(const std::string& path)
    : m_path(path), m_file(path, std::ios::binary), m_buffer(MediaRangeService::kChunkSize) {
    if (!m_file.is_open()) {
        throw std::runtime_error("Cannot open " + path);
    }
}

std::size_t ChunkReader::readChunk(std::uintmax_t offset, std::uintmax_t maxLength,
                                   const MediaRangeService::ChunkWriter& writer) {
    const std::size_t want = static_cast<std::size_t>(
        std::min<std::uintmax_t>(maxLength, MediaRangeService::kChunkSize));
    if (want == 0) return 0;

    m_file.clear();
    m_file.seekg(static_cast<std::streamoff>(offset));
    m_file.read(m_buffer.data(), static_cast<std::streamsize>(want));
    const std::size_t got = static_cast<std::size_t>(m_file.gcount());
    if (got == 0) return 0;
    if (!writer(m_buffer.data(), got)) return 0;
    return got;
}

} // namespace lyricflow::application

/**
 * @file JsonCodec.cpp
 * @brief Implementation of JsonCodec.
 */

#include "infrastructure/JsonCodec.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace lyricflow::infrastructure {

json JsonCodec::ToJson(const domain::Segment& segment) {
    json j = {
        {"start", segment.start},
        {"end", segment.end},
        {"text", segment.text}
    };
    if (segment.translated) {
        j["translated"] = *segment.translated;
    }
    return j;
}

json JsonCodec::ToJson(const domain::SegmentList& segments) {
    json arr = json::array();
    for (const auto& segment : segments) {
        arr.push_back(ToJson(segment));
    }
    return arr;
}

json JsonCodec::ToJson(const domain::SongMetadata& metadata) {
    return {
        {"song_id", metadata.songId},
        {"title", metadata.title},
        {"duration", metadata.durationSeconds},
        {"detected_language", metadata.detectedLanguage},
        {"youtube_url", metadata.sourceUrl},
        {"created_at", metadata.createdAt}
    };
}

domain::Segment JsonCodec::SegmentFromJson(const json& j) {
    domain::Segment segment;
    segment.start = j.at("start").get<double>();
    segment.end = j.at("end").get<double>();
    segment.text = j.at("text").get<std::string>();
    if (j.contains("translated") && j["translated"].is_string()) {
        segment.translated = j["translated"].get<std::string>();
    }
    return segment;
}

domain::SegmentList JsonCodec::SegmentsFromJson(const json& j) {
    domain::SegmentList segments;
    if (!j.is_array()) {
        throw std::invalid_argument("segment list must be a JSON array");
    }
    segments.reserve(j.size());
    for (const auto& item : j) {
        segments.push_back(SegmentFromJson(item));
    }
    return segments;
}

domain::SongMetadata JsonCodec::MetadataFromJson(const json& j) {
    domain::SongMetadata metadata;
    metadata.songId = j.at("song_id").get<std::string>();
    metadata.sourceUrl = j.at("youtube_url").get<std::string>();
    metadata.title = j.value("title", std::string("Unknown"));
    if (j.contains("duration") && j["duration"].is_number()) {
        metadata.durationSeconds = j["duration"].get<double>();
    }
    metadata.detectedLanguage = j.value("detected_language", std::string("unknown"));
    if (j.contains("created_at") && j["created_at"].is_number()) {
        metadata.createdAt = j["created_at"].get<double>();
    }
    return metadata;
}

} // namespace lyricflow::infrastructure

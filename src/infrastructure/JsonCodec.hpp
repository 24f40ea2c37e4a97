/**
 * @file JsonCodec.hpp
 * @brief JSON mapping of segments and song metadata for the on-disk store and the HTTP API.
 */

#pragma once
#include <nlohmann/json.hpp>
#include "domain/Segment.hpp"
#include "domain/Song.hpp"

namespace lyricflow::infrastructure {

class JsonCodec {
public:
    static nlohmann::json ToJson(const domain::Segment& segment);
    static nlohmann::json ToJson(const domain::SegmentList& segments);
    static nlohmann::json ToJson(const domain::SongMetadata& metadata);

    /** @throws nlohmann::json::exception or std::invalid_argument on malformed input. */
    static domain::Segment SegmentFromJson(const nlohmann::json& j);
    static domain::SegmentList SegmentsFromJson(const nlohmann::json& j);

    /** @brief Tolerates missing optional fields; song_id and url are required. */
    static domain::SongMetadata MetadataFromJson(const nlohmann::json& j);
};

} // namespace lyricflow::infrastructure

/**
 * @file Segment.hpp
 * @brief Domain value object for a timestamped span of recognized text.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace lyricflow::domain {

/**
 * @struct Segment
 * @brief A span of lyrics with start/end times in seconds (0 <= start <= end).
 */
struct Segment {
    double start = 0.0;                    ///< Start time in seconds.
    double end = 0.0;                      ///< End time in seconds.
    std::string text;                      ///< Recognized text, trimmed.
    std::optional<std::string> translated; ///< English rendering, when aligned.
};

using SegmentList = std::vector<Segment>;

/**
 * @struct Transcript
 * @brief Output of a transcription pass: ordered segments plus the language code.
 */
struct Transcript {
    SegmentList segments;
    std::string language = "unknown";
};

} // namespace lyricflow::domain

/**
 * @file LyricsFormatter.hpp
 * @brief Renders segments as the HTML snippet consumed by the lyrics sync page.
 */

#pragma once
#include <string>
#include "domain/Segment.hpp"

namespace lyricflow::application {

class LyricsFormatter {
public:
    /**
     * @brief One `<div class="lyric-line" data-timestamp="S">` block per segment,
     * S being the whole-second start time.
     */
    static std::string ToHtml(const domain::SegmentList& segments);

    /** @brief "[m:ss]" label of a start time, truncated to whole seconds. */
    static std::string FormatTimestamp(double seconds);

private:
    static std::string EscapeHtml(const std::string& text);
};

} // namespace lyricflow::application

#include "application/LyricsFormatter.hpp"
#include <iomanip>
#include <sstream>

namespace lyricflow::application {

std::string LyricsFormatter::FormatTimestamp(double seconds) {
    long long whole = seconds > 0 ? static_cast<long long>(seconds) : 0;
    std::ostringstream ss;
    ss << "[" << (whole / 60) << ":" << std::setw(2) << std::setfill('0') << (whole % 60) << "]";
    return ss.str();
}

std::string LyricsFormatter::EscapeHtml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string LyricsFormatter::ToHtml(const domain::SegmentList& segments) {
    std::ostringstream html;
    bool first = true;
    for (const auto& segment : segments) {
        long long start = segment.start > 0 ? static_cast<long long>(segment.start) : 0;
        if (!first) html << "\n";
        first = false;
        html << "            <div class=\"lyric-line\" data-timestamp=\"" << start << "\">\n"
             << "                <span class=\"timestamp\">" << FormatTimestamp(segment.start) << "</span>\n"
             << "                <span class=\"lyric-text\">" << EscapeHtml(segment.text) << "</span>\n"
             << "            </div>";
    }
    return html.str();
}

} // namespace lyricflow::application

#include "application/SourceUrl.hpp"
#include <regex>

namespace lyricflow::application {

std::string SourceUrl::Normalize(const std::string& url) {
    const char* ws = " \t\r\n";
    size_t first = url.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = url.find_last_not_of(ws);
    return url.substr(first, last - first + 1);
}

std::optional<std::string> SourceUrl::ExtractVideoId(const std::string& url) {
    static const std::regex kPatterns[] = {
        std::regex(R"((?:youtube\.com/watch\?v=|youtu\.be/|youtube\.com/embed/)([^&\n?#]+))"),
        std::regex(R"(youtube\.com.*[?&]v=([^&\n?#]+))"),
    };

    std::smatch match;
    for (const auto& pattern : kPatterns) {
        if (std::regex_search(url, match, pattern) && match[1].length() > 0) {
            return match[1].str();
        }
    }
    return std::nullopt;
}

} // namespace lyricflow::application

#include "application/LanguageDisambiguator.hpp"
#include <algorithm>
#include <cctype>

namespace lyricflow::application {

namespace {

const std::vector<std::string> kHindiIndicators = {
    "hai", "hoon", "mein", "tum", "kya", "aur", "se", "ko", "ka", "ki", "ke"
};
const std::vector<std::string> kTamilIndicators = {
    "tha", "illa", "enna", "naan", "oru", "alla", "irukku"
};
const std::vector<std::string> kNoIndicators;

std::string JoinLower(const domain::SegmentList& segments) {
    std::string joined;
    for (const auto& segment : segments) {
        if (!joined.empty()) joined += ' ';
        joined += segment.text;
    }
    std::transform(joined.begin(), joined.end(), joined.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return joined;
}

} // namespace

bool LanguageDisambiguator::IsAmbiguous(const std::string& languageCode) {
    return languageCode == "hi" || languageCode == "ta";
}

const std::vector<std::string>& LanguageDisambiguator::Indicators(const std::string& languageCode) {
    if (languageCode == "hi") return kHindiIndicators;
    if (languageCode == "ta") return kTamilIndicators;
    return kNoIndicators;
}

int LanguageDisambiguator::Score(const domain::SegmentList& segments, const std::string& languageCode) {
    const std::string text = JoinLower(segments);
    int score = 0;
    for (const auto& word : Indicators(languageCode)) {
        if (text.find(word) != std::string::npos) {
            ++score;
        }
    }
    return score;
}

LanguageDisambiguator::Verdict LanguageDisambiguator::Decide(const domain::SegmentList& hindiPass,
                                                             const domain::SegmentList& tamilPass) {
    int hindi = Score(hindiPass, "hi");
    int tamil = Score(tamilPass, "ta");
    if (hindi > tamil) return Verdict::Hindi;
    if (tamil > hindi) return Verdict::Tamil;
    return Verdict::Undecided;
}

} // namespace lyricflow::application

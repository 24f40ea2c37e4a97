/**
 * @file LanguageDisambiguator.hpp
 * @brief Scores Hindi and Tamil transcripts by common function words.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Segment.hpp"

namespace lyricflow::application {

/**
 * @class LanguageDisambiguator
 * @brief Auto-detection confuses Hindi and Tamil on sung audio. Re-running the
 * engine forced to each language and counting frequent words of that language
 * in the output picks the better reading.
 */
class LanguageDisambiguator {
public:
    enum class Verdict {
        Hindi,
        Tamil,
        Undecided
    };

    /** @brief True for the language codes this class can settle. */
    static bool IsAmbiguous(const std::string& languageCode);

    /**
     * @brief Number of indicators of @p languageCode found as case-insensitive
     * substrings of the joined segment texts. Each indicator counts once.
     */
    static int Score(const domain::SegmentList& segments, const std::string& languageCode);

    /** @brief Strictly higher score wins; a tie is Undecided. */
    static Verdict Decide(const domain::SegmentList& hindiPass, const domain::SegmentList& tamilPass);

    static const std::vector<std::string>& Indicators(const std::string& languageCode);
};

} // namespace lyricflow::application

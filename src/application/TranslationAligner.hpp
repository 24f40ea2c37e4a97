/**
 * @file TranslationAligner.hpp
 * @brief Attaches English text to transcribed segments by nearest start time.
 */

#pragma once
#include <memory>
#include <string>
#include "application/TranscriptionService.hpp"

namespace lyricflow::application {

class TranslationAligner {
public:
    explicit TranslationAligner(std::shared_ptr<TranscriptionService> transcription);

    /**
     * @brief Returns @p segments with `translated` filled in.
     *
     * Only English is supported as a target; any other target, or an empty
     * input, returns the input unchanged. Never throws for engine failures:
     * the original text is copied into `translated` instead.
     */
    domain::SegmentList align(const domain::SegmentList& segments,
                              const std::string& targetLanguage,
                              const std::string& audioPath,
                              const domain::ProgressSink& progress = nullptr);

    /** @brief Nearest-start matching; the first English segment wins ties. */
    static void AttachNearest(domain::SegmentList& segments, const domain::SegmentList& english);

private:
    static void CopyOriginal(domain::SegmentList& segments);

    std::shared_ptr<TranscriptionService> m_transcription;
};

} // namespace lyricflow::application

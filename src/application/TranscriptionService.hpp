/**
 * @file TranscriptionService.hpp
 * @brief Turns an audio file into timestamped segments and a language code.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include "application/SpeechModelManager.hpp"
#include "domain/Segment.hpp"
#include "domain/Song.hpp"

namespace lyricflow::application {

/**
 * @class TranscriptionService
 * @brief Runs recognition passes through the shared model, including the
 * Hindi/Tamil re-check after auto-detection.
 */
class TranscriptionService {
public:
    explicit TranscriptionService(std::shared_ptr<SpeechModelManager> models);

    /**
     * @brief Transcribes @p audioPath.
     * @param forcedLanguage Skips detection and disambiguation when set.
     * @param progress Receives "Transcribing audio: N%" updates.
     * @throws domain::TranscriptionError on engine failure.
     */
    domain::Transcript transcribe(const std::string& audioPath,
                                  const std::optional<std::string>& forcedLanguage,
                                  const domain::ProgressSink& progress = nullptr);

    /** @brief Runs the translate task, producing English segments. */
    domain::SegmentList translateToEnglish(const std::string& audioPath,
                                           const domain::ProgressSink& progress = nullptr);

private:
    domain::Transcript pass(const std::string& audioPath,
                            domain::RecognitionTask task,
                            const std::optional<std::string>& language,
                            const std::string& label,
                            const domain::ProgressSink& progress);

    std::shared_ptr<SpeechModelManager> m_models;
};

} // namespace lyricflow::application

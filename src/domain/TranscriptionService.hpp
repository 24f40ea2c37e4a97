/**
 * @file TranscriptionService.hpp
 * @brief Interfaces for the external speech recognition engine.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "Segment.hpp"

namespace lyricflow::domain {

/**
 * @enum RecognitionTask
 * @brief Transcribe keeps the spoken language, Translate renders English.
 */
enum class RecognitionTask {
    Transcribe,
    Translate
};

/**
 * @struct RecognitionRequest
 * @brief One full pass of the engine over an audio file.
 */
struct RecognitionRequest {
    std::string audioPath;
    RecognitionTask task = RecognitionTask::Transcribe;
    std::optional<std::string> language; ///< Forced language code; auto-detect when empty.
    std::function<void(int percent)> onProgress;
};

/**
 * @class SpeechModel
 * @brief A loaded recognition model. Not assumed to be reentrant.
 */
class SpeechModel {
public:
    virtual ~SpeechModel() = default;

    /** @brief Name of the quality tier this model was loaded at. */
    virtual std::string tier() const = 0;

    /**
     * @brief Runs a full pass and returns segments in engine order.
     * @throws TranscriptionError if inference fails.
     */
    virtual Transcript run(const RecognitionRequest& request) = 0;
};

/**
 * @class SpeechModelLoader
 * @brief Loads models by tier name and manages the on-disk model cache.
 */
class SpeechModelLoader {
public:
    virtual ~SpeechModelLoader() = default;

    /**
     * @brief Loads the model for @p tier.
     * @throws ModelLoadError on missing, corrupt or unreadable model files.
     */
    virtual std::unique_ptr<SpeechModel> load(const std::string& tier) = 0;

    /**
     * @brief Purges the on-disk cache after an integrity failure.
     * @return True if the cache was cleaned.
     */
    virtual bool clearCache() = 0;
};

} // namespace lyricflow::domain

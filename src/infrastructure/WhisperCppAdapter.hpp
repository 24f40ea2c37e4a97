#pragma once

#include "domain/TranscriptionService.hpp"
#include <string>

// Forward declaration to avoid including whisper.h in the header.
struct whisper_context;

namespace lyricflow::infrastructure {

/**
 * @class WhisperCppModel
 * @brief whisper.cpp context loaded at one tier. Owns the context.
 *
 * whisper_context is not safe for parallel inference; callers serialize
 * access (see application::SpeechModelManager).
 */
class WhisperCppModel : public domain::SpeechModel {
public:
    WhisperCppModel(whisper_context* ctx, std::string tier, std::string ffmpegPath, int threads);
    ~WhisperCppModel() override;

    WhisperCppModel(const WhisperCppModel&) = delete;
    WhisperCppModel& operator=(const WhisperCppModel&) = delete;

    std::string tier() const override { return m_tier; }
    domain::Transcript run(const domain::RecognitionRequest& request) override;

private:
    whisper_context* m_ctx = nullptr;
    std::string m_tier;
    std::string m_ffmpegPath;
    int m_threads;
};

/**
 * @class WhisperCppAdapter
 * @brief Loads ggml Whisper models (`ggml-<tier>.bin`) from a models directory.
 */
class WhisperCppAdapter : public domain::SpeechModelLoader {
public:
    WhisperCppAdapter(const std::string& modelsDir, const std::string& ffmpegPath, int threads);
    ~WhisperCppAdapter() override = default;

    std::unique_ptr<domain::SpeechModel> load(const std::string& tier) override;

    /** @brief Removes partial downloads and model files with a bad ggml header. */
    bool clearCache() override;

    /** @brief Path the model of @p tier is expected at. */
    std::string modelPath(const std::string& tier) const;

private:
    std::string m_modelsDir;
    std::string m_ffmpegPath;
    int m_threads;

    static bool HasValidHeader(const std::string& path);
};

} // namespace lyricflow::infrastructure

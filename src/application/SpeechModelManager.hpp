/**
 * @file SpeechModelManager.hpp
 * @brief Process-wide owner of the loaded speech model with tier fallback.
 */

#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/TranscriptionService.hpp"

namespace lyricflow::application {

/**
 * @class SpeechModelManager
 * @brief Loads the model lazily and serializes every use of it.
 *
 * Tiers are ordered from most to least accurate. Loading starts at the target
 * tier and walks down the list until a tier loads. A failure mentioning a
 * checksum purges the loader's cache before the next tier is tried.
 */
class SpeechModelManager {
public:
    SpeechModelManager(std::shared_ptr<domain::SpeechModelLoader> loader,
                       std::vector<std::string> tiers,
                       const std::string& targetTier);

    /**
     * @brief Runs @p request on the shared model, loading it first if needed.
     * @throws domain::TranscriptionError when no tier can be loaded or the pass fails.
     */
    domain::Transcript run(const domain::RecognitionRequest& request);

    /** @brief Tier of the currently loaded model, if any. */
    std::optional<std::string> loadedTier() const;

    /** @brief Drops the loaded model. Blocks while a pass is running. */
    void release();

    /** @brief Drops the loaded model and purges the on-disk cache. */
    bool clearCache();

private:
    domain::SpeechModel& ensureLoadedUnlocked();
    static bool IsIntegrityFailure(const std::string& message);

    std::shared_ptr<domain::SpeechModelLoader> m_loader;
    std::vector<std::string> m_tiers;
    size_t m_targetIndex = 0;
    std::unique_ptr<domain::SpeechModel> m_model;
    mutable std::mutex m_mutex;
};

} // namespace lyricflow::application

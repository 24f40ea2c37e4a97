#include "application/SpeechModelManager.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace lyricflow::application {

SpeechModelManager::SpeechModelManager(std::shared_ptr<domain::SpeechModelLoader> loader,
                                       std::vector<std::string> tiers,
                                       const std::string& targetTier)
    : m_loader(std::move(loader)), m_tiers(std::move(tiers)) {
    auto it = std::find(m_tiers.begin(), m_tiers.end(), targetTier);
    if (it != m_tiers.end()) {
        m_targetIndex = static_cast<size_t>(std::distance(m_tiers.begin(), it));
    }
}

bool SpeechModelManager::IsIntegrityFailure(const std::string& message) {
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("sha256") != std::string::npos || lower.find("checksum") != std::string::npos;
}

domain::SpeechModel& SpeechModelManager::ensureLoadedUnlocked() {
    if (m_model) {
        return *m_model;
    }

    std::string lastError = "no model tiers configured";
    for (size_t i = m_targetIndex; i < m_tiers.size(); ++i) {
        const std::string& tier = m_tiers[i];
        try {
            m_model = m_loader->load(tier);
            if (m_model) {
                std::cout << "[SpeechModelManager] Using model tier " << tier << std::endl;
                return *m_model;
            }
            lastError = "loader returned no model for tier " + tier;
        } catch (const std::exception& e) {
            lastError = e.what();
            std::cerr << "[SpeechModelManager] Tier " << tier << " failed: " << lastError << std::endl;
            if (IsIntegrityFailure(lastError)) {
                std::cerr << "[SpeechModelManager] Integrity failure, clearing model cache." << std::endl;
                if (!m_loader->clearCache()) {
                    std::cerr << "[SpeechModelManager] Model cache could not be fully cleared." << std::endl;
                }
            }
        }
    }
    throw domain::TranscriptionError("No speech model could be loaded: " + lastError);
}

domain::Transcript SpeechModelManager::run(const domain::RecognitionRequest& request) {
    std::lock_guard<std::mutex> lock(m_mutex);
    domain::SpeechModel& model = ensureLoadedUnlocked();
    return model.run(request);
}

std::optional<std::string> SpeechModelManager::loadedTier() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_model) return std::nullopt;
    return m_model->tier();
}

void SpeechModelManager::release() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_model) {
        std::cout << "[SpeechModelManager] Releasing model tier " << m_model->tier() << std::endl;
        m_model.reset();
    }
}

bool SpeechModelManager::clearCache() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_model.reset();
    bool ok = m_loader->clearCache();
    std::cout << "[SpeechModelManager] Cache clear " << (ok ? "succeeded" : "failed") << std::endl;
    return ok;
}

} // namespace lyricflow::application

/**
 * @file LyricFlowApp.cpp
 * @brief Implementation of the LyricFlowApp class.
 */

#include "app/LyricFlowApp.hpp"
#include "infrastructure/FileRepository.hpp"
#include "infrastructure/HttpApiServer.hpp"
#include "infrastructure/WhisperCppAdapter.hpp"
#include "infrastructure/YtDlpDownloader.hpp"
#include <filesystem>
#include <iostream>

namespace lyricflow::app {

LyricFlowApp::LyricFlowApp(const std::string& configPath)
    : m_configPath(configPath) {}

LyricFlowApp::~LyricFlowApp() = default;

bool LyricFlowApp::Init() {
    m_config = infrastructure::ConfigLoader::Load(m_configPath);
    std::cout << "[LyricFlowApp] Data directory: " << std::filesystem::absolute(m_config.dataDir).string() << std::endl;
    std::cout << "[LyricFlowApp] Models directory: " << m_config.modelsDir
              << " (target tier " << m_config.targetTier << ")" << std::endl;

    // Dependency Injection / Composition Root
    try {
        m_services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
        m_services.repository = std::make_shared<infrastructure::FileRepository>(
            m_config.songsDir(), m_config.libraryPath(), m_services.persistenceService);
    } catch (const std::exception& e) {
        std::cerr << "[LyricFlowApp] Cannot prepare data directory: " << e.what() << std::endl;
        return false;
    }

    auto loader = std::make_shared<infrastructure::WhisperCppAdapter>(
        m_config.modelsDir, m_config.ffmpegPath, m_config.threads);
    auto downloader = std::make_shared<infrastructure::YtDlpDownloader>(m_config.ytdlpPath);

    m_services.modelManager = std::make_shared<application::SpeechModelManager>(
        loader, m_config.modelTiers, m_config.targetTier);
    m_services.transcriptionService = std::make_shared<application::TranscriptionService>(m_services.modelManager);
    m_services.translationAligner = std::make_shared<application::TranslationAligner>(m_services.transcriptionService);
    m_services.acquisitionService = std::make_shared<application::AcquisitionService>(downloader, m_services.repository);
    m_services.jobTracker = std::make_shared<application::JobTracker>();
    m_services.taskManager = std::make_shared<application::AsyncTaskManager>();
    m_services.orchestrator = std::make_shared<application::JobOrchestrator>(
        m_services.acquisitionService, m_services.transcriptionService, m_services.translationAligner,
        m_services.repository, m_services.taskManager, m_services.jobTracker);
    m_services.mediaService = std::make_shared<application::MediaRangeService>(m_services.repository);

    m_server = std::make_unique<infrastructure::HttpApiServer>(
        m_services.orchestrator, m_services.mediaService, m_services.repository, m_services.modelManager);
    return true;
}

int LyricFlowApp::Run() {
    if (!Init()) {
        return 1;
    }
    bool ok = m_server->listen(m_config.host, m_config.port);
    Shutdown();
    return ok ? 0 : 1;
}

void LyricFlowApp::RequestStop() {
    if (m_server) {
        m_server->stop();
    }
}

void LyricFlowApp::Shutdown() {
    std::cout << "[LyricFlowApp] Shutting down" << std::endl;
    if (m_services.taskManager && !m_services.taskManager->GetActiveTasks().empty()) {
        std::cout << "[LyricFlowApp] Waiting for running jobs to finish" << std::endl;
    }
    // Running pipelines may still load the model for their next pass
    if (m_services.orchestrator) {
        m_services.orchestrator->drain();
    }
    if (m_services.modelManager) {
        m_services.modelManager->release();
    }
}

} // namespace lyricflow::app

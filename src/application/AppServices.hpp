/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/AcquisitionService.hpp"
#include "application/AsyncTaskManager.hpp"
#include "application/JobOrchestrator.hpp"
#include "application/JobTracker.hpp"
#include "application/MediaRangeService.hpp"
#include "application/SpeechModelManager.hpp"
#include "application/TranscriptionService.hpp"
#include "application/TranslationAligner.hpp"
#include "domain/SongRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace lyricflow::application {

struct AppServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<domain::SongRepository> repository;
    std::shared_ptr<SpeechModelManager> modelManager;
    std::shared_ptr<TranscriptionService> transcriptionService;
    std::shared_ptr<TranslationAligner> translationAligner;
    std::shared_ptr<AcquisitionService> acquisitionService;
    std::shared_ptr<JobTracker> jobTracker;
    std::shared_ptr<JobOrchestrator> orchestrator;
    std::shared_ptr<MediaRangeService> mediaService;
    std::shared_ptr<AsyncTaskManager> taskManager;
};

} // namespace lyricflow::application

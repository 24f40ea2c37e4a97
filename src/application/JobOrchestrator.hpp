/**
 * @file JobOrchestrator.hpp
 * @brief Entry point of the processing pipeline: dedup, job allocation and the
 * acquisition -> transcription -> translation -> persistence run.
 */

#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include "application/AcquisitionService.hpp"
#include "application/AsyncTaskManager.hpp"
#include "application/JobTracker.hpp"
#include "application/TranscriptionService.hpp"
#include "application/TranslationAligner.hpp"
#include "domain/SongRepository.hpp"

namespace lyricflow::application {

/**
 * @struct SubmitOutcome
 * @brief Answer to a submission: either an existing catalog record or a job id to poll.
 */
struct SubmitOutcome {
    std::string songId;
    std::optional<domain::SongMetadata> metadata;
    bool alreadyProcessed = false;
    bool processing = false;
};

/**
 * @class JobOrchestrator
 * @brief Runs one pipeline per source URL in the background and exposes its progress.
 *
 * A URL already in the library is answered from the catalog. A URL whose job is
 * still running is answered with that job's id. Only one pipeline per URL is
 * ever in flight.
 */
class JobOrchestrator {
public:
    JobOrchestrator(std::shared_ptr<AcquisitionService> acquisition,
                    std::shared_ptr<TranscriptionService> transcription,
                    std::shared_ptr<TranslationAligner> aligner,
                    std::shared_ptr<domain::SongRepository> repository,
                    std::shared_ptr<AsyncTaskManager> taskManager,
                    std::shared_ptr<JobTracker> tracker);

    /** @brief Waits for running pipelines, which reference this object. */
    ~JobOrchestrator();

    /**
     * @brief Starts processing @p sourceUrl unless it is known already.
     * @param translate Align an English rendering when the detected language is not English.
     * @param language Forced language code; auto-detect when empty.
     * @throws domain::InvalidSourceError for empty URLs or URLs without a video id.
     */
    SubmitOutcome submit(const std::string& sourceUrl,
                         bool translate,
                         const std::optional<std::string>& language);

    /** @brief Snapshot of the job; status Unknown for ids never allocated. */
    domain::Job status(const std::string& jobId) const;

    /** @brief Blocks until every submitted pipeline has ended. */
    void drain();

private:
    void runPipeline(const std::string& jobId,
                     const std::string& sourceUrl,
                     bool translate,
                     const std::optional<std::string>& language);
    void finish(const std::string& sourceUrl);
    std::string newJobId();

    std::shared_ptr<AcquisitionService> m_acquisition;
    std::shared_ptr<TranscriptionService> m_transcription;
    std::shared_ptr<TranslationAligner> m_aligner;
    std::shared_ptr<domain::SongRepository> m_repository;
    std::shared_ptr<AsyncTaskManager> m_taskManager;
    std::shared_ptr<JobTracker> m_tracker;

    std::mutex m_submitMutex;                       ///< Guards the dedup check and m_inFlight.
    std::map<std::string, std::string> m_inFlight;  ///< source URL -> running job id.
    std::mt19937_64 m_rng{std::random_device{}()};
};

} // namespace lyricflow::application

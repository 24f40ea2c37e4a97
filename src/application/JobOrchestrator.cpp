#include "application/JobOrchestrator.hpp"
#include "application/SourceUrl.hpp"
#include "domain/Errors.hpp"
#include <chrono>
#include <cstdio>
#include <iostream>

namespace lyricflow::application {

JobOrchestrator::JobOrchestrator(std::shared_ptr<AcquisitionService> acquisition,
                                 std::shared_ptr<TranscriptionService> transcription,
                                 std::shared_ptr<TranslationAligner> aligner,
                                 std::shared_ptr<domain::SongRepository> repository,
                                 std::shared_ptr<AsyncTaskManager> taskManager,
                                 std::shared_ptr<JobTracker> tracker)
    : m_acquisition(std::move(acquisition))
    , m_transcription(std::move(transcription))
    , m_aligner(std::move(aligner))
    , m_repository(std::move(repository))
    , m_taskManager(std::move(taskManager))
    , m_tracker(std::move(tracker)) {}

JobOrchestrator::~JobOrchestrator() {
    drain();
}

void JobOrchestrator::drain() {
    m_taskManager->WaitIdle();
}

std::string JobOrchestrator::newJobId() {
    // RFC 4122 version 4 layout
    std::uniform_int_distribution<unsigned long long> dist;
    unsigned long long hi = dist(m_rng);
    unsigned long long lo = dist(m_rng);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  (hi >> 32) & 0xFFFFFFFFULL,
                  (hi >> 16) & 0xFFFFULL,
                  hi & 0xFFFFULL,
                  (lo >> 48) & 0xFFFFULL,
                  lo & 0xFFFFFFFFFFFFULL);
    return buffer;
}

SubmitOutcome JobOrchestrator::submit(const std::string& sourceUrl,
                                      bool translate,
                                      const std::optional<std::string>& language) {
    const std::string url = SourceUrl::Normalize(sourceUrl);
    if (url.empty()) {
        throw domain::InvalidSourceError("No URL provided");
    }
    if (!SourceUrl::ExtractVideoId(url)) {
        throw domain::InvalidSourceError("Invalid YouTube URL");
    }

    SubmitOutcome outcome;
    std::string jobId;
    {
        std::lock_guard<std::mutex> lock(m_submitMutex);
        if (auto existing = m_repository->findByUrl(url)) {
            std::cout << "[JobOrchestrator] Already processed: " << url << " -> " << existing->songId << std::endl;
            outcome.songId = existing->songId;
            outcome.metadata = existing;
            outcome.alreadyProcessed = true;
            return outcome;
        }

        auto running = m_inFlight.find(url);
        if (running != m_inFlight.end()) {
            std::cout << "[JobOrchestrator] Job " << running->second << " already running for " << url << std::endl;
            outcome.songId = running->second;
            outcome.processing = true;
            return outcome;
        }

        jobId = newJobId();
        m_inFlight[url] = jobId;
        m_tracker->create(jobId, url);
    }

    std::cout << "[JobOrchestrator] Job " << jobId << " started for " << url << std::endl;
    m_taskManager->SubmitTask(TaskType::Pipeline, "Process " + url,
        [this, jobId, url, translate, language](std::shared_ptr<TaskStatus>) {
            runPipeline(jobId, url, translate, language);
        });

    outcome.songId = jobId;
    outcome.processing = true;
    return outcome;
}

domain::Job JobOrchestrator::status(const std::string& jobId) const {
    return m_tracker->get(jobId);
}

void JobOrchestrator::finish(const std::string& sourceUrl) {
    std::lock_guard<std::mutex> lock(m_submitMutex);
    m_inFlight.erase(sourceUrl);
}

void JobOrchestrator::runPipeline(const std::string& jobId,
                                  const std::string& sourceUrl,
                                  bool translate,
                                  const std::optional<std::string>& language) {
    auto step = [this, &jobId](const std::string& text) {
        m_tracker->updateStep(jobId, text);
    };

    try {
        step("Downloading audio");
        AcquiredAudio audio = m_acquisition->acquire(sourceUrl, jobId, step);

        step("Transcribing audio");
        domain::Transcript transcript = m_transcription->transcribe(audio.filePath, language, step);
        domain::SegmentList segments = std::move(transcript.segments);

        if (translate && transcript.language != "en") {
            step("Translating to English");
            segments = m_aligner->align(segments, "en", audio.filePath, step);
        }

        step("Saving results");
        domain::SongMetadata metadata;
        metadata.songId = jobId;
        metadata.title = audio.title;
        metadata.durationSeconds = audio.durationSeconds;
        metadata.detectedLanguage = transcript.language;
        metadata.sourceUrl = sourceUrl;
        metadata.createdAt = std::chrono::duration<double>(
            std::chrono::system_clock::now().time_since_epoch()).count();

        m_repository->saveSong(metadata, segments);
        m_repository->appendToLibrary(metadata);

        m_tracker->complete(jobId, metadata);
        std::cout << "[JobOrchestrator] Job " << jobId << " completed: \"" << metadata.title << "\" ("
                  << segments.size() << " segments, " << metadata.detectedLanguage << ")" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[JobOrchestrator] Job " << jobId << " failed: " << e.what() << std::endl;
        m_repository->discardSong(jobId);
        m_tracker->fail(jobId, e.what());
    } catch (...) {
        std::cerr << "[JobOrchestrator] Job " << jobId << " failed with a non-standard exception" << std::endl;
        m_repository->discardSong(jobId);
        m_tracker->fail(jobId, "Processing failed");
    }
    finish(sourceUrl);
}

} // namespace lyricflow::application

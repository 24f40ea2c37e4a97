/**
 * @file Song.hpp
 * @brief Domain entities for processed songs and in-flight processing jobs.
 */

#pragma once
#include <optional>
#include <string>
#include <functional>

namespace lyricflow::domain {

/**
 * @struct SongMetadata
 * @brief Catalog record written once per successfully processed source.
 */
struct SongMetadata {
    std::string songId;
    std::string title;
    double durationSeconds = 0.0;
    std::string detectedLanguage;
    std::string sourceUrl;
    double createdAt = 0.0; ///< Unix time in seconds.
};

/**
 * @enum JobStatus
 * @brief Lifecycle of a processing job. Unknown is reported for ids never allocated.
 */
enum class JobStatus {
    Queued,
    Processing,
    Completed,
    Error,
    Unknown
};

inline const char* JobStatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::Queued: return "queued";
        case JobStatus::Processing: return "processing";
        case JobStatus::Completed: return "completed";
        case JobStatus::Error: return "error";
        case JobStatus::Unknown: return "unknown";
    }
    return "unknown";
}

inline bool IsTerminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Error;
}

/**
 * @struct Job
 * @brief Observable state of one pipeline run. Copied out as a snapshot on every read.
 */
struct Job {
    std::string jobId;
    std::string sourceUrl;
    JobStatus status = JobStatus::Unknown;
    std::string step = "unknown";
    std::optional<SongMetadata> result;
    std::optional<std::string> errorDetail;
};

/** @brief Receives human-readable progress text from a pipeline stage. */
using ProgressSink = std::function<void(const std::string&)>;

} // namespace lyricflow::domain

/**
 * @file JobTracker.hpp
 * @brief In-memory table of processing jobs.
 */

#pragma once
#include <map>
#include <mutex>
#include <string>
#include "domain/Song.hpp"

namespace lyricflow::application {

/**
 * @class JobTracker
 * @brief Mutex-guarded map of jobs. Reads return a copy taken under the lock,
 * so a poller never observes a half-updated job.
 */
class JobTracker {
public:
    /** @brief Registers @p jobId as processing at step "Starting". */
    void create(const std::string& jobId, const std::string& sourceUrl);

    void updateStep(const std::string& jobId, const std::string& step);
    void complete(const std::string& jobId, const domain::SongMetadata& metadata);
    void fail(const std::string& jobId, const std::string& detail);

    /** @brief Snapshot of @p jobId; status Unknown if it was never created. */
    domain::Job get(const std::string& jobId) const;

private:
    std::map<std::string, domain::Job> m_jobs;
    mutable std::mutex m_mutex;
};

} // namespace lyricflow::application

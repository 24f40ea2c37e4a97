#include "application/JobTracker.hpp"

namespace lyricflow::application {

void JobTracker::create(const std::string& jobId, const std::string& sourceUrl) {
    domain::Job job;
    job.jobId = jobId;
    job.sourceUrl = sourceUrl;
    job.status = domain::JobStatus::Processing;
    job.step = "Starting";
    std::lock_guard<std::mutex> lock(m_mutex);
    m_jobs[jobId] = std::move(job);
}

void JobTracker::updateStep(const std::string& jobId, const std::string& step) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end() || domain::IsTerminal(it->second.status)) return;
    it->second.step = step;
}

void JobTracker::complete(const std::string& jobId, const domain::SongMetadata& metadata) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) return;
    it->second.status = domain::JobStatus::Completed;
    it->second.step = "Done";
    it->second.result = metadata;
    it->second.errorDetail.reset();
}

void JobTracker::fail(const std::string& jobId, const std::string& detail) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) return;
    it->second.status = domain::JobStatus::Error;
    it->second.errorDetail = detail.empty() ? std::string("Processing failed") : detail;
}

domain::Job JobTracker::get(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) {
        domain::Job unknown;
        unknown.jobId = jobId;
        return unknown;
    }
    return it->second;
}

} // namespace lyricflow::application

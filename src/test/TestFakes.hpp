#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "domain/AudioDownloader.hpp"
#include "domain/Errors.hpp"
#include "domain/TranscriptionService.hpp"

namespace lyricflow::test {

inline std::filesystem::path MakeTestRoot(const std::string& name) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto root = std::filesystem::temp_directory_path() / ("lyricflow_" + name + "_" + std::to_string(stamp));
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);
    return root;
}

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline domain::SegmentList MakeSegments(const std::vector<std::pair<double, std::string>>& items) {
    domain::SegmentList segments;
    for (const auto& item : items) {
        domain::Segment s;
        s.start = item.first;
        s.end = item.first + 1.0;
        s.text = item.second;
        segments.push_back(s);
    }
    return segments;
}

/** Shared counters of every FakeSpeechModel created by one loader. */
struct ModelCounters {
    std::atomic<int> runs{0};
    std::atomic<int> translateRuns{0};
    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};
};

using RecognitionHandler = std::function<domain::Transcript(const domain::RecognitionRequest&)>;

class FakeSpeechModel : public domain::SpeechModel {
public:
    FakeSpeechModel(std::string tier, RecognitionHandler handler, std::shared_ptr<ModelCounters> counters,
                    int delayMs)
        : m_tier(std::move(tier)), m_handler(std::move(handler)), m_counters(std::move(counters)), m_delayMs(delayMs) {}

    std::string tier() const override { return m_tier; }

    domain::Transcript run(const domain::RecognitionRequest& request) override {
        int now = ++m_counters->inFlight;
        int seen = m_counters->maxInFlight.load();
        while (now > seen && !m_counters->maxInFlight.compare_exchange_weak(seen, now)) {}
        ++m_counters->runs;
        if (request.task == domain::RecognitionTask::Translate) ++m_counters->translateRuns;

        if (request.onProgress) {
            request.onProgress(50);
        }
        if (m_delayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(m_delayMs));
        }
        if (request.onProgress) {
            request.onProgress(100);
        }
        --m_counters->inFlight;
        return m_handler(request);
    }

private:
    std::string m_tier;
    RecognitionHandler m_handler;
    std::shared_ptr<ModelCounters> m_counters;
    int m_delayMs;
};

/** Loader whose tiers fail with configured messages; everything else loads a FakeSpeechModel. */
class FakeModelLoader : public domain::SpeechModelLoader {
public:
    explicit FakeModelLoader(RecognitionHandler handler)
        : counters(std::make_shared<ModelCounters>()), m_handler(std::move(handler)) {}

    std::unique_ptr<domain::SpeechModel> load(const std::string& tier) override {
        attempts.push_back(tier);
        auto it = failures.find(tier);
        if (it != failures.end()) {
            throw domain::ModelLoadError(it->second);
        }
        return std::make_unique<FakeSpeechModel>(tier, m_handler, counters, delayMs);
    }

    bool clearCache() override {
        ++clearCalls;
        return true;
    }

    std::shared_ptr<ModelCounters> counters;
    std::map<std::string, std::string> failures; ///< tier -> load error message
    std::vector<std::string> attempts;
    int clearCalls = 0;
    int delayMs = 0;

private:
    RecognitionHandler m_handler;
};

/** Downloader that writes a file into the target directory instead of touching the network. */
class FakeDownloader : public domain::AudioDownloader {
public:
    domain::MediaInfo fetchInfo(const std::string& url) override {
        ++infoCalls;
        if (failInfo) {
            throw domain::AcquisitionError("metadata unavailable for " + url);
        }
        return info;
    }

    void download(const std::string& url, const std::string& directory, ProgressHook hook) override {
        ++downloads;
        if (delayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
        }
        if (failDownload) {
            throw domain::AcquisitionError("network unreachable while fetching " + url);
        }
        if (hook) {
            domain::DownloadProgress half;
            half.downloadedBytes = 50;
            half.totalBytes = 100;
            half.etaSeconds = 13.0;
            hook(half);

            domain::DownloadProgress done;
            done.finished = true;
            done.downloadedBytes = 100;
            done.totalBytes = 100;
            hook(done);
        }
        if (!outputName.empty()) {
            WriteFile(std::filesystem::path(directory) / outputName, payload);
        }
        for (const auto& extra : extraFiles) {
            WriteFile(std::filesystem::path(directory) / extra, "leftover");
        }
    }

    domain::MediaInfo info{"Test Song", 180.0};
    bool failInfo = false;
    bool failDownload = false;
    int delayMs = 0;
    std::string outputName = "Test Song.mp3";
    std::string payload = std::string(4096, 'a');
    std::vector<std::string> extraFiles;
    std::atomic<int> downloads{0};
    std::atomic<int> infoCalls{0};
};

} // namespace lyricflow::test

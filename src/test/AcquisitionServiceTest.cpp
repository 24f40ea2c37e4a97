#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/AcquisitionService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/FileRepository.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "TestFakes.hpp"

using namespace lyricflow;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> ListNames(const fs::path& dir) {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    return names;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Acquisition Service Test..." << std::endl;

    // Progress text
    {
        domain::DownloadProgress p;
        p.downloadedBytes = 42;
        p.totalBytes = 100;
        p.etaSeconds = 13.0;
        assert(application::AcquisitionService::FormatProgress(p) == "Downloading audio: 42.0% (ETA 13s)");

        domain::DownloadProgress unknownTotal;
        unknownTotal.downloadedBytes = 1048576;
        assert(application::AcquisitionService::FormatProgress(unknownTotal) == "Downloading audio: 1.0 MB");

        domain::DownloadProgress done;
        done.finished = true;
        assert(application::AcquisitionService::FormatProgress(done) == "Converting audio");
        std::cout << "[PASS] Progress formatting." << std::endl;
    }

    auto root = test::MakeTestRoot("acquisition");
    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto repo = std::make_shared<infrastructure::FileRepository>(
        (root / "songs").string(), (root / "library.json").string(), persistence);
    const std::string url = "https://www.youtube.com/watch?v=abc123";

    // Fresh download is relocated to audio.mp3, leftovers removed
    {
        auto downloader = std::make_shared<test::FakeDownloader>();
        downloader->extraFiles = {"Test Song.webm", "Test Song.m4a.part"};
        application::AcquisitionService service(downloader, repo);

        std::vector<std::string> steps;
        auto audio = service.acquire(url, "song-a", [&steps](const std::string& s) { steps.push_back(s); });

        assert(audio.title == "Test Song");
        assert(audio.durationSeconds == 180.0);
        assert(fs::path(audio.filePath).filename() == "audio.mp3");
        assert(fs::file_size(audio.filePath) == 4096);
        assert((ListNames(root / "songs" / "song-a") == std::vector<std::string>{"audio.mp3"}));
        assert(steps.size() == 2);
        assert(steps[0] == "Downloading audio: 50.0% (ETA 13s)");
        assert(steps[1] == "Converting audio");
        std::cout << "[PASS] Download relocated to the canonical path." << std::endl;
    }

    // Existing audio is reused; metadata failure falls back to defaults
    {
        test::WriteFile(root / "songs" / "song-b" / "audio.mp3", "cached");
        auto downloader = std::make_shared<test::FakeDownloader>();
        downloader->failInfo = true;
        application::AcquisitionService service(downloader, repo);

        auto audio = service.acquire(url, "song-b");
        assert(downloader->downloads == 0);
        assert(audio.title == "Unknown");
        assert(audio.durationSeconds == 0.0);
        assert(fs::file_size(audio.filePath) == 6);
        std::cout << "[PASS] Existing audio reused without download." << std::endl;
    }

    // Engine failure
    {
        auto downloader = std::make_shared<test::FakeDownloader>();
        downloader->failDownload = true;
        application::AcquisitionService service(downloader, repo);
        bool threw = false;
        try {
            service.acquire(url, "song-c");
        } catch (const domain::AcquisitionError& e) {
            threw = true;
            assert(std::string(e.what()).find("network unreachable") != std::string::npos);
        }
        assert(threw);
        std::cout << "[PASS] Engine failure raises AcquisitionError." << std::endl;
    }

    // Engine reports success but leaves no audio
    {
        auto downloader = std::make_shared<test::FakeDownloader>();
        downloader->outputName.clear();
        application::AcquisitionService service(downloader, repo);
        bool threw = false;
        try {
            service.acquire(url, "song-d");
        } catch (const domain::AcquisitionError&) {
            threw = true;
        }
        assert(threw);
        assert(!fs::exists(root / "songs" / "song-d" / "audio.mp3"));
        std::cout << "[PASS] Missing output raises AcquisitionError." << std::endl;
    }

    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "application/AcquisitionService.hpp"
#include "application/AsyncTaskManager.hpp"
#include "application/JobOrchestrator.hpp"
#include "application/JobTracker.hpp"
#include "application/MediaRangeService.hpp"
#include "application/SpeechModelManager.hpp"
#include "application/TranscriptionService.hpp"
#include "application/TranslationAligner.hpp"
#include "infrastructure/FileRepository.hpp"
#include "infrastructure/HttpApiServer.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "TestFakes.hpp"

using namespace lyricflow;
namespace fs = std::filesystem;

namespace {

domain::Transcript Silence(const domain::RecognitionRequest&) {
    domain::Transcript t;
    t.language = "en";
    return t;
}

std::string Pattern(size_t size) {
    std::string data(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>(i % 251);
    }
    return data;
}

/** Checks that every header the media service computed arrived unchanged. */
void AssertWireHeaders(const httplib::Result& r, const application::MediaResponse& expected) {
    for (const auto& header : expected.headers) {
        if (r->get_header_value(header.first) != header.second) {
            std::cerr << "[FAIL] " << header.first << ": expected '" << header.second << "', got '"
                      << r->get_header_value(header.first) << "'" << std::endl;
            assert(false);
        }
    }
}

} // namespace

int main() {
    std::cout << "[Test] Starting HTTP Media Test..." << std::endl;

    auto root = test::MakeTestRoot("http_media");
    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto repo = std::make_shared<infrastructure::FileRepository>(
        (root / "songs").string(), (root / "library.json").string(), persistence);
    auto loader = std::make_shared<test::FakeModelLoader>(Silence);
    auto models = std::make_shared<application::SpeechModelManager>(loader, std::vector<std::string>{"base"}, "base");
    auto transcription = std::make_shared<application::TranscriptionService>(models);
    auto tasks = std::make_shared<application::AsyncTaskManager>();
    auto orchestrator = std::make_shared<application::JobOrchestrator>(
        std::make_shared<application::AcquisitionService>(std::make_shared<test::FakeDownloader>(), repo),
        transcription,
        std::make_shared<application::TranslationAligner>(transcription),
        repo, tasks, std::make_shared<application::JobTracker>());
    auto media = std::make_shared<application::MediaRangeService>(repo);

    const std::string songId = "song-1";
    const std::string audio = Pattern(1000);
    test::WriteFile(root / "songs" / songId / "audio.mp3", audio);
    const std::string path = "/api/audio/" + songId;

    infrastructure::HttpApiServer server(orchestrator, media, repo, models);
    int port = server.bind("127.0.0.1", 0);
    assert(port > 0);
    std::thread serving([&server]() { server.serve(); });

    httplib::Client cli("127.0.0.1", port);
    bool ready = false;
    for (int i = 0; i < 200 && !ready; ++i) {
        ready = static_cast<bool>(cli.Get("/api/library"));
        if (!ready) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(ready);

    // Whole file
    {
        auto r = cli.Get(path);
        assert(r && r->status == 200);
        assert(r->body == audio);
        assert(r->get_header_value("Content-Length") == "1000");
        assert(r->get_header_value("Accept-Ranges") == "bytes");
        assert(r->get_header_value("Content-Type") == "audio/mpeg");
        assert(!r->has_header("Content-Range"));
        AssertWireHeaders(r, media->prepare(songId, std::nullopt));
        std::cout << "[PASS] No Range header returns the whole file with 200." << std::endl;
    }

    // Closed and open-ended ranges
    {
        auto r = cli.Get(path, httplib::Headers{{"Range", "bytes=100-199"}});
        assert(r && r->status == 206);
        assert(r->get_header_value("Content-Range") == "bytes 100-199/1000");
        assert(r->get_header_value("Content-Length") == "100");
        assert(r->body == audio.substr(100, 100));
        AssertWireHeaders(r, media->prepare(songId, std::string("bytes=100-199")));

        auto tail = cli.Get(path, httplib::Headers{{"Range", "bytes=900-"}});
        assert(tail && tail->status == 206);
        assert(tail->get_header_value("Content-Range") == "bytes 900-999/1000");
        assert(tail->body == audio.substr(900));
        AssertWireHeaders(tail, media->prepare(songId, std::string("bytes=900-")));

        auto big = Pattern(20000);
        test::WriteFile(root / "songs" / "song-2" / "audio.mp3", big);
        auto wide = cli.Get("/api/audio/song-2", httplib::Headers{{"Range", "bytes=5-19000"}});
        assert(wide && wide->status == 206);
        assert(wide->body == big.substr(5, 18996));
        std::cout << "[PASS] Ranges return exactly the requested span with 206." << std::endl;
    }

    // Refused ranges, whether httplib or the media service rejects them
    for (const std::string header : {"bytes=abc-", "bytes=-100", "bytes=0-1,5-6", "bytes=1000-", "bytes=100-1000",
                                     "bytes=300-200", "items=0-1"}) {
        auto r = cli.Get(path, httplib::Headers{{"Range", header}});
        if (!r || r->status != 416 || r->get_header_value("Content-Range") != "bytes */1000") {
            std::cerr << "[FAIL] Range '" << header << "' -> " << (r ? r->status : -1) << std::endl;
            assert(false);
        }
        assert(nlohmann::json::parse(r->body).contains("error"));
    }
    std::cout << "[PASS] Unsatisfiable ranges return 416 with the file size." << std::endl;

    // Missing audio
    {
        auto r = cli.Get("/api/audio/absent");
        assert(r && r->status == 404);
        assert(nlohmann::json::parse(r->body)["error"] == "Audio file not found");
        auto ranged = cli.Get("/api/audio/absent", httplib::Headers{{"Range", "bytes=abc-"}});
        assert(ranged && ranged->status == 404);
        std::cout << "[PASS] Unknown songs return 404." << std::endl;
    }

    // Status polling for ids never allocated
    {
        auto r = cli.Get("/api/process-status/never-allocated");
        assert(r && r->status == 200);
        auto body = nlohmann::json::parse(r->body);
        assert(body["status"] == "unknown" && body["step"] == "unknown");
        std::cout << "[PASS] Unknown job ids report unknown." << std::endl;
    }

    server.stop();
    serving.join();
    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}

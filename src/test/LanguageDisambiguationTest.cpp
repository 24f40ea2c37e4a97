#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/LanguageDisambiguator.hpp"
#include "application/SpeechModelManager.hpp"
#include "application/TranscriptionService.hpp"
#include "TestFakes.hpp"

using namespace lyricflow;

namespace {

/** Auto pass reports @p autoLanguage; forced passes return the given texts. */
test::RecognitionHandler Scripted(const std::string& autoLanguage,
                                  const std::string& autoText,
                                  const std::string& hindiText,
                                  const std::string& tamilText) {
    return [=](const domain::RecognitionRequest& req) {
        domain::Transcript t;
        if (!req.language) {
            t.language = autoLanguage;
            if (!autoText.empty()) t.segments = test::MakeSegments({{0.0, autoText}});
        } else if (*req.language == "hi") {
            t.language = "hi";
            t.segments = test::MakeSegments({{0.0, hindiText}});
        } else if (*req.language == "ta") {
            t.language = "ta";
            t.segments = test::MakeSegments({{0.0, tamilText}});
        } else {
            t.language = *req.language;
            t.segments = test::MakeSegments({{0.0, "forced"}});
        }
        return t;
    };
}

application::TranscriptionService MakeService(std::shared_ptr<test::FakeModelLoader> loader) {
    auto models = std::make_shared<application::SpeechModelManager>(
        loader, std::vector<std::string>{"base"}, "base");
    return application::TranscriptionService(models);
}

} // namespace

int main() {
    std::cout << "[Test] Starting Language Disambiguation Test..." << std::endl;

    // Scoring
    assert(application::LanguageDisambiguator::Score(test::MakeSegments({{0, "TUM kya"}, {1, "hai"}}), "hi") == 3);
    assert(application::LanguageDisambiguator::Score(test::MakeSegments({{0, "naan"}}), "ta") == 1);
    assert(application::LanguageDisambiguator::Score(test::MakeSegments({{0, "hai hai hai"}}), "hi") == 1);
    assert(application::LanguageDisambiguator::Score({}, "hi") == 0);
    assert(application::LanguageDisambiguator::IsAmbiguous("ta"));
    assert(!application::LanguageDisambiguator::IsAmbiguous("en"));
    std::cout << "[PASS] Indicator scoring." << std::endl;

    // Hindi reading scores 3 against 1: Hindi adopted
    {
        auto loader = std::make_shared<test::FakeModelLoader>(Scripted("ta", "auto text", "tum kya hai", "naan"));
        auto service = MakeService(loader);
        auto transcript = service.transcribe("song.mp3", std::nullopt);
        assert(transcript.language == "hi");
        assert(transcript.segments.size() == 1 && transcript.segments[0].text == "tum kya hai");
        assert(loader->counters->runs == 3);
        std::cout << "[PASS] Higher Hindi score overrides detection." << std::endl;
    }

    // Tamil reading wins
    {
        auto loader = std::make_shared<test::FakeModelLoader>(Scripted("hi", "auto text", "xyz", "naan oru"));
        auto service = MakeService(loader);
        auto transcript = service.transcribe("song.mp3", std::nullopt);
        assert(transcript.language == "ta");
        assert(transcript.segments[0].text == "naan oru");
        std::cout << "[PASS] Higher Tamil score overrides detection." << std::endl;
    }

    // 2 against 2 keeps the auto-detected pass
    {
        auto loader = std::make_shared<test::FakeModelLoader>(Scripted("ta", "auto text", "tum kya", "naan oru"));
        auto service = MakeService(loader);
        auto transcript = service.transcribe("song.mp3", std::nullopt);
        assert(transcript.language == "ta");
        assert(transcript.segments[0].text == "auto text");
        std::cout << "[PASS] Tie keeps auto-detected result." << std::endl;
    }

    // No segments: no extra passes
    {
        auto loader = std::make_shared<test::FakeModelLoader>(Scripted("hi", "", "tum kya hai", "naan"));
        auto service = MakeService(loader);
        auto transcript = service.transcribe("song.mp3", std::nullopt);
        assert(transcript.language == "hi");
        assert(transcript.segments.empty());
        assert(loader->counters->runs == 1);
        std::cout << "[PASS] Empty auto pass skips disambiguation." << std::endl;
    }

    // Other languages and forced languages skip disambiguation
    {
        auto loader = std::make_shared<test::FakeModelLoader>(Scripted("es", "hola", "", ""));
        auto service = MakeService(loader);
        assert(service.transcribe("song.mp3", std::nullopt).language == "es");
        std::vector<std::string> steps;
        auto forced = service.transcribe("song.mp3", std::string("ta"),
                                         [&steps](const std::string& s) { steps.push_back(s); });
        assert(forced.language == "ta");
        assert(forced.segments.size() == 1);
        assert(loader->counters->runs == 2);
        assert(!steps.empty() && steps.back() == "Transcribing audio: 100%");
        std::cout << "[PASS] Forced language runs a single pass." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>

#include "application/SpeechModelManager.hpp"
#include "application/TranscriptionService.hpp"
#include "application/TranslationAligner.hpp"
#include "TestFakes.hpp"

using namespace lyricflow;

namespace {

std::shared_ptr<application::TranslationAligner> MakeAligner(std::shared_ptr<test::FakeModelLoader> loader) {
    auto models = std::make_shared<application::SpeechModelManager>(
        loader, std::vector<std::string>{"base"}, "base");
    auto transcription = std::make_shared<application::TranscriptionService>(models);
    return std::make_shared<application::TranslationAligner>(transcription);
}

} // namespace

int main() {
    std::cout << "[Test] Starting TranslationAligner Test..." << std::endl;

    auto root = test::MakeTestRoot("aligner");
    auto audio = root / "audio.mp3";
    test::WriteFile(audio, "not really audio");

    auto original = test::MakeSegments({{0.0, "uno"}, {5.0, "dos"}, {10.0, "tres"}});

    // Nearest start wins
    {
        auto loader = std::make_shared<test::FakeModelLoader>([](const domain::RecognitionRequest& req) {
            assert(req.task == domain::RecognitionTask::Translate);
            domain::Transcript t;
            t.language = "en";
            t.segments = test::MakeSegments({{0.2, "one"}, {5.1, "two"}, {11.0, "three"}});
            return t;
        });
        auto aligner = MakeAligner(loader);
        auto aligned = aligner->align(original, "en", audio.string());
        assert(aligned.size() == 3);
        assert(aligned[0].translated && *aligned[0].translated == "one");
        assert(aligned[1].translated && *aligned[1].translated == "two");
        assert(aligned[2].translated && *aligned[2].translated == "three");
        assert(aligned[1].text == "dos");
        assert(aligned[2].start == 10.0);
        std::cout << "[PASS] Segments aligned by nearest start." << std::endl;
    }

    // Ties go to the first English segment seen
    {
        auto segments = test::MakeSegments({{5.0, "cinco"}});
        auto english = test::MakeSegments({{4.0, "early"}, {6.0, "late"}});
        application::TranslationAligner::AttachNearest(segments, english);
        assert(*segments[0].translated == "early");
        std::cout << "[PASS] Tie resolved to first seen." << std::endl;
    }

    // Engine failure degrades to the original text
    {
        auto loader = std::make_shared<test::FakeModelLoader>([](const domain::RecognitionRequest&) -> domain::Transcript {
            throw domain::TranscriptionError("decoder crashed");
        });
        auto aligner = MakeAligner(loader);
        auto aligned = aligner->align(original, "en", audio.string());
        assert(aligned.size() == 3);
        for (const auto& s : aligned) {
            assert(s.translated && *s.translated == s.text);
        }
        std::cout << "[PASS] Failed translate pass copies original text." << std::endl;
    }

    // Missing audio degrades without running the engine
    {
        auto loader = std::make_shared<test::FakeModelLoader>([](const domain::RecognitionRequest&) {
            return domain::Transcript{};
        });
        auto aligner = MakeAligner(loader);
        auto aligned = aligner->align(original, "en", (root / "missing.mp3").string());
        assert(*aligned[0].translated == "uno");
        assert(loader->counters->runs == 0);
        std::cout << "[PASS] Missing audio copies original text." << std::endl;
    }

    // Non-English target and empty input are returned unchanged
    {
        auto loader = std::make_shared<test::FakeModelLoader>([](const domain::RecognitionRequest&) {
            return domain::Transcript{};
        });
        auto aligner = MakeAligner(loader);
        auto same = aligner->align(original, "fr", audio.string());
        assert(same.size() == 3 && !same[0].translated);
        auto empty = aligner->align({}, "en", audio.string());
        assert(empty.empty());
        assert(loader->counters->runs == 0);
        std::cout << "[PASS] Unsupported target and empty input untouched." << std::endl;
    }

    // No English output at all
    {
        auto loader = std::make_shared<test::FakeModelLoader>([](const domain::RecognitionRequest&) {
            return domain::Transcript{};
        });
        auto aligner = MakeAligner(loader);
        auto aligned = aligner->align(original, "en", audio.string());
        assert(*aligned[2].translated == "tres");
        std::cout << "[PASS] Empty translation falls back to original text." << std::endl;
    }

    std::filesystem::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}

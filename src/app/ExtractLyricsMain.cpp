/**
 * @file ExtractLyricsMain.cpp
 * @brief Offline tool: transcribes a local audio file and prints its lyrics.
 */

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "application/LyricsFormatter.hpp"
#include "application/SpeechModelManager.hpp"
#include "application/TranscriptionService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonCodec.hpp"
#include "infrastructure/WhisperCppAdapter.hpp"

using namespace lyricflow;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <audio_file_path> [output_format]" << std::endl;
        std::cerr << "Output formats: html (default), json" << std::endl;
        return 1;
    }

    const std::string audioFile = argv[1];
    const std::string format = argc > 2 ? argv[2] : "html";
    if (format != "html" && format != "json") {
        std::cerr << "Error: unknown output format '" << format << "'" << std::endl;
        return 1;
    }
    if (!std::filesystem::exists(audioFile)) {
        std::cerr << "Error: Audio file '" << audioFile << "' not found" << std::endl;
        return 1;
    }

    infrastructure::AppConfig config = infrastructure::ConfigLoader::Load("settings.json");
    auto loader = std::make_shared<infrastructure::WhisperCppAdapter>(config.modelsDir, config.ffmpegPath, config.threads);
    auto models = std::make_shared<application::SpeechModelManager>(loader, config.modelTiers, config.targetTier);
    application::TranscriptionService transcription(models);

    std::cerr << "[lyricflow_extract] Processing audio file: " << audioFile << std::endl;
    try {
        domain::Transcript transcript = transcription.transcribe(audioFile, std::nullopt,
            [](const std::string& step) { std::cerr << "\r[lyricflow_extract] " << step << std::flush; });
        std::cerr << std::endl << "[lyricflow_extract] Language: " << transcript.language
                  << ", " << transcript.segments.size() << " segments" << std::endl;

        if (format == "json") {
            std::cout << infrastructure::JsonCodec::ToJson(transcript.segments).dump(2) << std::endl;
        } else {
            std::cout << application::LyricsFormatter::ToHtml(transcript.segments) << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << std::endl << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

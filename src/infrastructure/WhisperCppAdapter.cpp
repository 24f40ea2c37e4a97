/**
 * @file WhisperCppAdapter.cpp
 * @brief Implementation of the whisper.cpp backed speech model and loader.
 */
#include "infrastructure/WhisperCppAdapter.hpp"
#include "infrastructure/AudioUtils.hpp"
#include "domain/Errors.hpp"
#include "whisper.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <vector>

namespace lyricflow::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr std::uint32_t kGgmlMagic = 0x67676d6c; // "ggml"

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

void ProgressTrampoline(struct whisper_context* /*ctx*/, struct whisper_state* /*state*/, int progress, void* userData) {
    auto* callback = static_cast<const std::function<void(int)>*>(userData);
    if (callback && *callback) {
        (*callback)(progress);
    }
}

} // namespace

WhisperCppModel::WhisperCppModel(whisper_context* ctx, std::string tier, std::string ffmpegPath, int threads)
    : m_ctx(ctx)
    , m_tier(std::move(tier))
    , m_ffmpegPath(std::move(ffmpegPath))
    , m_threads(threads)
{}

WhisperCppModel::~WhisperCppModel() {
    if (m_ctx) {
        whisper_free(m_ctx);
    }
}

domain::Transcript WhisperCppModel::run(const domain::RecognitionRequest& request) {
    std::vector<float> pcmf32;
    std::string error;
    if (!AudioUtils::LoadAudioFile(m_ffmpegPath, request.audioPath, pcmf32, error)) {
        throw domain::TranscriptionError("Audio load failed: " + error);
    }

    std::string language = "auto";
    if (request.language && !request.language->empty()) {
        if (whisper_lang_id(request.language->c_str()) == -1) {
            throw domain::TranscriptionError("Unknown language code: " + *request.language);
        }
        language = *request.language;
    }

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_progress = false;
    wparams.print_special = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;
    wparams.translate = request.task == domain::RecognitionTask::Translate;
    wparams.language = language.c_str();
    wparams.n_threads = m_threads;
    wparams.token_timestamps = true;
    if (request.onProgress) {
        wparams.progress_callback = ProgressTrampoline;
        wparams.progress_callback_user_data = const_cast<std::function<void(int)>*>(&request.onProgress);
    }

    if (whisper_full(m_ctx, wparams, pcmf32.data(), static_cast<int>(pcmf32.size())) != 0) {
        throw domain::TranscriptionError("Whisper inference failed on " + request.audioPath);
    }

    domain::Transcript transcript;
    const int langId = whisper_full_lang_id(m_ctx);
    const char* langStr = langId >= 0 ? whisper_lang_str(langId) : nullptr;
    transcript.language = langStr ? langStr : "unknown";

    // Timestamps are reported in 10 ms units
    const int n_segments = whisper_full_n_segments(m_ctx);
    transcript.segments.reserve(static_cast<size_t>(n_segments));
    for (int i = 0; i < n_segments; ++i) {
        domain::Segment segment;
        segment.start = static_cast<double>(whisper_full_get_segment_t0(m_ctx, i)) / 100.0;
        segment.end = static_cast<double>(whisper_full_get_segment_t1(m_ctx, i)) / 100.0;
        if (segment.end < segment.start) segment.end = segment.start;
        const char* text = whisper_full_get_segment_text(m_ctx, i);
        segment.text = Trim(text ? text : "");
        transcript.segments.push_back(std::move(segment));
    }
    return transcript;
}

WhisperCppAdapter::WhisperCppAdapter(const std::string& modelsDir, const std::string& ffmpegPath, int threads)
    : m_modelsDir(modelsDir)
    , m_ffmpegPath(ffmpegPath)
    , m_threads(threads)
{
    // Don't load in constructor to keep it fast/safe. Load on first use.
}

std::string WhisperCppAdapter::modelPath(const std::string& tier) const {
    return (fs::path(m_modelsDir) / ("ggml-" + tier + ".bin")).string();
}

bool WhisperCppAdapter::HasValidHeader(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return false;
    std::uint32_t magic = 0;
    in.read(reinterpret_cast<char*>(&magic), sizeof(magic));
    return in.gcount() == sizeof(magic) && magic == kGgmlMagic;
}

std::unique_ptr<domain::SpeechModel> WhisperCppAdapter::load(const std::string& tier) {
    const std::string path = modelPath(tier);
    if (!fs::exists(path)) {
        throw domain::ModelLoadError("Model file not found: " + path + ". Place ggml-" + tier + ".bin in " + m_modelsDir);
    }
    if (!HasValidHeader(path)) {
        throw domain::ModelLoadError("Checksum mismatch: " + path + " is not a valid ggml model");
    }

    struct whisper_context_params cparams = whisper_context_default_params();
    whisper_context* ctx = whisper_init_from_file_with_params(path.c_str(), cparams);
    if (!ctx) {
        throw domain::ModelLoadError("Failed to initialize whisper context from " + path);
    }

    std::cout << "[WhisperCppAdapter] Loaded model tier " << tier << " from " << path << std::endl;
    return std::make_unique<WhisperCppModel>(ctx, tier, m_ffmpegPath, m_threads);
}

bool WhisperCppAdapter::clearCache() {
    std::error_code ec;
    if (!fs::exists(m_modelsDir, ec)) {
        return true;
    }

    bool ok = true;
    for (const auto& entry : fs::directory_iterator(m_modelsDir, ec)) {
        if (!entry.is_regular_file()) continue;
        const fs::path& p = entry.path();
        const std::string ext = p.extension().string();
        bool partial = ext == ".tmp" || ext == ".part";
        bool corrupt = ext == ".bin" && !HasValidHeader(p.string());
        if (partial || corrupt) {
            std::error_code removeEc;
            fs::remove(p, removeEc);
            if (removeEc) {
                std::cerr << "[WhisperCppAdapter] Could not remove " << p << ": " << removeEc.message() << std::endl;
                ok = false;
            } else {
                std::cout << "[WhisperCppAdapter] Removed cached file " << p << std::endl;
            }
        }
    }
    if (ec) {
        std::cerr << "[WhisperCppAdapter] Cannot scan " << m_modelsDir << ": " << ec.message() << std::endl;
        ok = false;
    }
    return ok;
}

} // namespace lyricflow::infrastructure

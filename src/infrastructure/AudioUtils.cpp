#include "infrastructure/AudioUtils.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ProcessUtils.hpp"
#include <SDL.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <system_error>

namespace lyricflow::infrastructure {

namespace fs = std::filesystem;

bool AudioUtils::ConvertAudioToWav(const std::string& ffmpegPath, const std::string& inputPath,
                                   std::string& outputPath, std::string& error) {
    fs::path workDir = PathUtils::GetCacheHome() / "LyricFlow" / "wav";
    std::error_code ec;
    fs::create_directories(workDir, ec);
    if (ec) {
        workDir = fs::temp_directory_path();
    }

    // Parent directory name is the song id, which keeps concurrent jobs apart
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path input(inputPath);
    std::string stem = input.parent_path().filename().string() + "_" + input.stem().string();
    fs::path tempPath = workDir / (stem + "_" + std::to_string(stamp) + ".wav");
    outputPath = tempPath.string();

    std::string cmd = ProcessUtils::ShellQuote(ffmpegPath) + " -y -loglevel error -i " +
                      ProcessUtils::ShellQuote(inputPath) +
                      " -ar 16000 -ac 1 -c:a pcm_s16le " + ProcessUtils::ShellQuote(outputPath);

    int ret = ProcessUtils::ExecCmd(cmd);
    if (ret != 0) {
        error = "ffmpeg failed to convert audio (exit " + std::to_string(ret) + "). Is ffmpeg installed?";
        return false;
    }

    if (!fs::exists(outputPath)) {
        error = "Converted file not found: " + outputPath;
        return false;
    }

    return true;
}

bool AudioUtils::LoadAudioSDL(const std::string& fname, std::vector<float>& pcmf32, std::string& error) {
    SDL_AudioSpec wavSpec;
    Uint32 wavLength;
    Uint8 *wavBuffer;

    if (SDL_LoadWAV(fname.c_str(), &wavSpec, &wavBuffer, &wavLength) == NULL) {
        error = "SDL_LoadWAV failed: " + std::string(SDL_GetError());
        return false;
    }

    SDL_AudioCVT cvt;
    if (SDL_BuildAudioCVT(&cvt, wavSpec.format, wavSpec.channels, wavSpec.freq,
                          AUDIO_F32SYS, 1, 16000) < 0) {
        error = "SDL_BuildAudioCVT failed: " + std::string(SDL_GetError());
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    cvt.len = static_cast<int>(wavLength);
    cvt.buf = (Uint8 *)SDL_malloc(static_cast<size_t>(cvt.len) * cvt.len_mult);
    if (!cvt.buf) {
        error = "Out of memory while decoding " + fname;
        SDL_FreeWAV(wavBuffer);
        return false;
    }
    SDL_memcpy(cvt.buf, wavBuffer, wavLength);

    if (SDL_ConvertAudio(&cvt) < 0) {
        error = "SDL_ConvertAudio failed: " + std::string(SDL_GetError());
        SDL_free(cvt.buf);
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    size_t sampleCount = static_cast<size_t>(cvt.len_cvt) / sizeof(float);
    pcmf32.resize(sampleCount);
    SDL_memcpy(pcmf32.data(), cvt.buf, sampleCount * sizeof(float));

    SDL_free(cvt.buf);
    SDL_FreeWAV(wavBuffer);

    return true;
}

bool AudioUtils::LoadAudioFile(const std::string& ffmpegPath, const std::string& inputPath,
                               std::vector<float>& pcmf32, std::string& error) {
    if (!fs::exists(inputPath)) {
        error = "Audio file not found: " + inputPath;
        return false;
    }

    std::string ext = fs::path(inputPath).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    if (ext == ".wav") {
        return LoadAudioSDL(inputPath, pcmf32, error);
    }

    std::string wavPath;
    if (!ConvertAudioToWav(ffmpegPath, inputPath, wavPath, error)) {
        return false;
    }
    bool ok = LoadAudioSDL(wavPath, pcmf32, error);

    // Cleanup temp file immediately after loading
    std::error_code ec;
    fs::remove(wavPath, ec);
    return ok;
}

} // namespace lyricflow::infrastructure

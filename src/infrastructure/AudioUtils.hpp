#pragma once

#include <string>
#include <vector>

namespace lyricflow::infrastructure {

/**
 * @brief Utilities for audio processing.
 */
class AudioUtils {
public:
    /**
     * @brief Converts an audio file to 16kHz mono WAV using ffmpeg.
     * @param ffmpegPath ffmpeg executable.
     * @param inputPath Path to source file.
     * @param outputPath Output path (populated automatically).
     * @param error Populated on failure.
     * @return True if successful.
     */
    static bool ConvertAudioToWav(const std::string& ffmpegPath, const std::string& inputPath,
                                  std::string& outputPath, std::string& error);

    /**
     * @brief Loads a WAV file and converts it to 16kHz float32 mono (Whisper format).
     * @param fname Path to WAV file.
     * @param pcmf32 Resulting vector of samples.
     * @param error Populated on failure.
     * @return True if successful.
     */
    static bool LoadAudioSDL(const std::string& fname, std::vector<float>& pcmf32, std::string& error);

    /** @brief Converts (if needed) and decodes any audio file into Whisper samples. */
    static bool LoadAudioFile(const std::string& ffmpegPath, const std::string& inputPath,
                              std::vector<float>& pcmf32, std::string& error);
};

} // namespace lyricflow::infrastructure

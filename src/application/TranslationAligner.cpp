#include "application/TranslationAligner.hpp"
#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>

namespace lyricflow::application {

TranslationAligner::TranslationAligner(std::shared_ptr<TranscriptionService> transcription)
    : m_transcription(std::move(transcription)) {}

void TranslationAligner::CopyOriginal(domain::SegmentList& segments) {
    for (auto& segment : segments) {
        segment.translated = segment.text;
    }
}

void TranslationAligner::AttachNearest(domain::SegmentList& segments, const domain::SegmentList& english) {
    if (english.empty()) {
        CopyOriginal(segments);
        return;
    }
    for (auto& segment : segments) {
        const domain::Segment* best = nullptr;
        double bestDiff = std::numeric_limits<double>::infinity();
        for (const auto& candidate : english) {
            double diff = std::fabs(segment.start - candidate.start);
            if (diff < bestDiff) {
                bestDiff = diff;
                best = &candidate;
            }
        }
        segment.translated = best->text;
    }
}

domain::SegmentList TranslationAligner::align(const domain::SegmentList& segments,
                                              const std::string& targetLanguage,
                                              const std::string& audioPath,
                                              const domain::ProgressSink& progress) {
    if (targetLanguage != "en" || segments.empty()) {
        return segments;
    }

    domain::SegmentList aligned = segments;
    std::error_code ec;
    if (audioPath.empty() || !std::filesystem::exists(audioPath, ec)) {
        std::cerr << "[TranslationAligner] Translation degraded: audio not found at " << audioPath << std::endl;
        CopyOriginal(aligned);
        return aligned;
    }

    try {
        domain::SegmentList english = m_transcription->translateToEnglish(audioPath, progress);
        AttachNearest(aligned, english);
    } catch (const std::exception& e) {
        std::cerr << "[TranslationAligner] Translation degraded: " << e.what() << std::endl;
        CopyOriginal(aligned);
    }
    return aligned;
}

} // namespace lyricflow::application

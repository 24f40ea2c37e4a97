#include "application/TranscriptionService.hpp"
#include "application/LanguageDisambiguator.hpp"
#include <iostream>

namespace lyricflow::application {

TranscriptionService::TranscriptionService(std::shared_ptr<SpeechModelManager> models)
    : m_models(std::move(models)) {}

domain::Transcript TranscriptionService::pass(const std::string& audioPath,
                                              domain::RecognitionTask task,
                                              const std::optional<std::string>& language,
                                              const std::string& label,
                                              const domain::ProgressSink& progress) {
    domain::RecognitionRequest request;
    request.audioPath = audioPath;
    request.task = task;
    request.language = language;
    if (progress) {
        request.onProgress = [progress, label](int percent) {
            progress(label + ": " + std::to_string(percent) + "%");
        };
    }
    return m_models->run(request);
}

domain::Transcript TranscriptionService::transcribe(const std::string& audioPath,
                                                    const std::optional<std::string>& forcedLanguage,
                                                    const domain::ProgressSink& progress) {
    if (forcedLanguage && !forcedLanguage->empty()) {
        domain::Transcript forced = pass(audioPath, domain::RecognitionTask::Transcribe, forcedLanguage,
                                         "Transcribing audio", progress);
        forced.language = *forcedLanguage;
        return forced;
    }

    domain::Transcript detected = pass(audioPath, domain::RecognitionTask::Transcribe, std::nullopt,
                                       "Transcribing audio", progress);
    std::cout << "[TranscriptionService] Detected language: " << detected.language
              << " (" << detected.segments.size() << " segments)" << std::endl;

    if (!LanguageDisambiguator::IsAmbiguous(detected.language) || detected.segments.empty()) {
        return detected;
    }

    domain::Transcript hindi = pass(audioPath, domain::RecognitionTask::Transcribe, std::string("hi"),
                                    "Transcribing audio (hi check)", progress);
    domain::Transcript tamil = pass(audioPath, domain::RecognitionTask::Transcribe, std::string("ta"),
                                    "Transcribing audio (ta check)", progress);

    switch (LanguageDisambiguator::Decide(hindi.segments, tamil.segments)) {
        case LanguageDisambiguator::Verdict::Hindi:
            std::cout << "[TranscriptionService] Indicator scoring chose hi" << std::endl;
            hindi.language = "hi";
            return hindi;
        case LanguageDisambiguator::Verdict::Tamil:
            std::cout << "[TranscriptionService] Indicator scoring chose ta" << std::endl;
            tamil.language = "ta";
            return tamil;
        case LanguageDisambiguator::Verdict::Undecided:
            break;
    }
    std::cout << "[TranscriptionService] Indicator scores tied, keeping " << detected.language << std::endl;
    return detected;
}

domain::SegmentList TranscriptionService::translateToEnglish(const std::string& audioPath,
                                                             const domain::ProgressSink& progress) {
    return pass(audioPath, domain::RecognitionTask::Translate, std::nullopt,
                "Translating to English", progress).segments;
}

} // namespace lyricflow::application

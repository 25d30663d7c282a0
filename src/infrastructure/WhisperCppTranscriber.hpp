#pragma once

#include "domain/TranscriptionService.hpp"
#include <string>
#include <mutex>

struct whisper_context;

namespace timenotes::infrastructure {

/**
 * @class WhisperCppTranscriber
 * @brief TranscriptionService backed by an in-process whisper.cpp model.
 *
 * The model is loaded on first use. Inference on the shared context is serialized.
 */
class WhisperCppTranscriber : public domain::TranscriptionService {
public:
    WhisperCppTranscriber(const std::string& modelPath, const std::string& language = "auto");
    ~WhisperCppTranscriber() override;

    WhisperCppTranscriber(const WhisperCppTranscriber&) = delete;
    WhisperCppTranscriber& operator=(const WhisperCppTranscriber&) = delete;

    domain::Transcript transcribe(const std::string& audioPath) override;

private:
    std::string m_modelPath;
    std::string m_language;

    whisper_context* m_ctx = nullptr;
    std::mutex m_mutex;

    void loadModel();
};

} // namespace timenotes::infrastructure

/**
 * @file WhisperCppTranscriber.cpp
 * @brief Implementation of the WhisperCppTranscriber class.
 */
#include "infrastructure/WhisperCppTranscriber.hpp"
#include "infrastructure/AudioUtils.hpp"
#include "domain/PipelineErrors.hpp"
#include "whisper.h"

#include <filesystem>
#include <iostream>
#include <vector>
#include <algorithm>
#include <thread>

namespace timenotes::infrastructure {

namespace {

std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

WhisperCppTranscriber::WhisperCppTranscriber(const std::string& modelPath, const std::string& language)
    : m_modelPath(modelPath)
    , m_language(language.empty() ? "auto" : language)
{
}

WhisperCppTranscriber::~WhisperCppTranscriber() {
    if (m_ctx) {
        whisper_free(m_ctx);
    }
}

void WhisperCppTranscriber::loadModel() {
    if (m_ctx) return;

    if (!std::filesystem::exists(m_modelPath)) {
        throw domain::TranscriptionError("Whisper model not found at: " + m_modelPath +
                                         ". Download a ggml model (e.g. ggml-base.bin).");
    }

    struct whisper_context_params cparams = whisper_context_default_params();
    m_ctx = whisper_init_from_file_with_params(m_modelPath.c_str(), cparams);

    if (!m_ctx) {
        throw domain::TranscriptionError("Failed to initialize whisper context from " + m_modelPath);
    }
    std::cout << "[WhisperCppTranscriber] Loaded model " << m_modelPath << std::endl;
}

domain::Transcript WhisperCppTranscriber::transcribe(const std::string& audioPath) {
    if (!std::filesystem::exists(audioPath)) {
        throw domain::TranscriptionError("Audio file not found: " + audioPath);
    }

    std::vector<float> pcmf32;
    std::string error;
    if (!AudioUtils::LoadAudioSDL(audioPath, pcmf32, error)) {
        throw domain::TranscriptionError("Failed to load audio: " + error);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    loadModel();

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_progress = false;
    wparams.print_special = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;
    wparams.language = m_language.c_str();
    wparams.n_threads = std::max(1u, std::thread::hardware_concurrency());

    if (whisper_full(m_ctx, wparams, pcmf32.data(), static_cast<int>(pcmf32.size())) != 0) {
        throw domain::TranscriptionError("Whisper inference failed for " + audioPath);
    }

    domain::Transcript transcript;
    const int langId = whisper_full_lang_id(m_ctx);
    const char* lang = langId >= 0 ? whisper_lang_str(langId) : nullptr;
    transcript.language = lang ? lang : m_language;

    const int n_segments = whisper_full_n_segments(m_ctx);
    for (int i = 0; i < n_segments; ++i) {
        domain::TranscriptSegment segment;
        // t0/t1 are in units of 10 ms.
        segment.start = whisper_full_get_segment_t0(m_ctx, i) / 100.0;
        segment.end = whisper_full_get_segment_t1(m_ctx, i) / 100.0;
        segment.text = Trim(whisper_full_get_segment_text(m_ctx, i));
        if (segment.end < segment.start) segment.end = segment.start;

        if (!transcript.text.empty() && !segment.text.empty()) transcript.text += " ";
        transcript.text += segment.text;
        transcript.segments.push_back(std::move(segment));
    }

    std::cout << "[WhisperCppTranscriber] " << n_segments << " segments, language "
              << transcript.language << std::endl;
    return transcript;
}

} // namespace timenotes::infrastructure

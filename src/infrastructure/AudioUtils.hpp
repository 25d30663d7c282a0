#pragma once

#include <string>
#include <vector>

namespace timenotes::infrastructure {

/**
 * @struct CommandResult
 * @brief Exit status and captured stdout/stderr of a subprocess.
 */
struct CommandResult {
    int exitCode = -1;
    bool timedOut = false;
    std::string output;
};

/**
 * @brief Utilities for audio processing.
 */
class AudioUtils {
public:
    /**
     * @brief Runs @p args as a subprocess, bounded by @p timeoutSeconds via coreutils `timeout`.
     * @param args Program followed by its arguments; each is shell-quoted.
     */
    static CommandResult RunCommand(const std::vector<std::string>& args, int timeoutSeconds);

    /** @brief Single-quotes @p arg for /bin/sh. */
    static std::string ShellQuote(const std::string& arg);

    /**
     * @brief Loads a WAV file and converts it to 16kHz float32 mono (Whisper format).
     * @param fname Path to WAV file.
     * @param pcmf32 Resulting vector of samples.
     * @param error Populated on failure.
     * @return True if successful.
     */
    static bool LoadAudioSDL(const std::string& fname, std::vector<float>& pcmf32, std::string& error);
};

} // namespace timenotes::infrastructure

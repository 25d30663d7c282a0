#include "infrastructure/AudioUtils.hpp"
#include <SDL.h>
#include <array>
#include <cstdio>
#include <iostream>
#include <sys/wait.h>

namespace timenotes::infrastructure {

namespace {
constexpr int kTimeoutExitCode = 124;
}

std::string AudioUtils::ShellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

CommandResult AudioUtils::RunCommand(const std::vector<std::string>& args, int timeoutSeconds) {
    CommandResult result;
    if (args.empty()) {
        result.output = "empty command";
        return result;
    }

    std::string cmd;
    if (timeoutSeconds > 0) {
        cmd = "timeout " + std::to_string(timeoutSeconds) + " ";
    }
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) cmd += ' ';
        cmd += ShellQuote(args[i]);
    }
    cmd += " 2>&1";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        result.output = "failed to start: " + args.front();
        return result;
    }

    std::array<char, 4096> buffer;
    size_t n;
    while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), n);
    }

    int status = pclose(pipe);
    if (status == -1) {
        result.exitCode = -1;
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else {
        result.exitCode = -1;
    }
    result.timedOut = timeoutSeconds > 0 && result.exitCode == kTimeoutExitCode;
    return result;
}

bool AudioUtils::LoadAudioSDL(const std::string& fname, std::vector<float>& pcmf32, std::string& error) {
    SDL_AudioSpec wavSpec;
    Uint32 wavLength;
    Uint8 *wavBuffer;

    if (SDL_LoadWAV(fname.c_str(), &wavSpec, &wavBuffer, &wavLength) == NULL) {
        error = "SDL_LoadWAV failed: " + std::string(SDL_GetError());
        return false;
    }

    SDL_AudioSpec targetSpec;
    SDL_zero(targetSpec);
    targetSpec.freq = 16000;
    targetSpec.format = AUDIO_F32SYS;
    targetSpec.channels = 1;

    SDL_AudioCVT cvt;
    if (SDL_BuildAudioCVT(&cvt, wavSpec.format, wavSpec.channels, wavSpec.freq,
                          targetSpec.format, targetSpec.channels, targetSpec.freq) < 0) {
        error = "SDL_BuildAudioCVT failed: " + std::string(SDL_GetError());
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    cvt.len = wavLength;
    cvt.buf = (Uint8 *)SDL_malloc(cvt.len * cvt.len_mult);
    if (!cvt.buf) {
        error = "Out of memory while converting " + fname;
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

    int sampleCount = cvt.len_cvt / sizeof(float);
    pcmf32.resize(sampleCount);
    SDL_memcpy(pcmf32.data(), cvt.buf, cvt.len_cvt);

    SDL_free(cvt.buf);
    SDL_FreeWAV(wavBuffer);

    return true;
}

} // namespace timenotes::infrastructure

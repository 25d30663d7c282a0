/**
 * @file FileArtifactStore.cpp
 * @brief Implementation of FileArtifactStore.
 */
#include "infrastructure/FileArtifactStore.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/PathUtils.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace timenotes::infrastructure {

namespace fs = std::filesystem;

FileArtifactStore::FileArtifactStore(fs::path outputDir)
    : m_outputDir(std::move(outputDir)) {
    PathUtils::EnsureDirectory(m_outputDir);
}

fs::path FileArtifactStore::PathFor(const std::string& jobId, domain::ArtifactKind kind) const {
    if (!PathUtils::IsSafeFileToken(jobId)) {
        return {};
    }
    return m_outputDir / (jobId + domain::ArtifactSuffix(kind));
}

bool FileArtifactStore::write(const std::string& jobId, domain::ArtifactKind kind, const std::string& content) {
    fs::path path = PathFor(jobId, kind);
    if (path.empty()) {
        std::cerr << "[FileArtifactStore] Refusing unsafe job id: " << jobId << std::endl;
        return false;
    }
    if (!AtomicFileWriter::Write(path, content)) {
        std::cerr << "[FileArtifactStore] Failed to write " << path << std::endl;
        return false;
    }
    return true;
}

bool FileArtifactStore::exists(const std::string& jobId, domain::ArtifactKind kind) const {
    fs::path path = PathFor(jobId, kind);
    if (path.empty()) return false;
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileArtifactStore::hasAny(const std::string& jobId) const {
    for (domain::ArtifactKind kind : domain::kAllArtifactKinds) {
        if (exists(jobId, kind)) return true;
    }
    return false;
}

std::optional<std::string> FileArtifactStore::read(const std::string& jobId, domain::ArtifactKind kind) const {
    if (!exists(jobId, kind)) return std::nullopt;

    std::ifstream in(PathFor(jobId, kind), std::ios::binary);
    if (!in.is_open()) return std::nullopt;
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace timenotes::infrastructure

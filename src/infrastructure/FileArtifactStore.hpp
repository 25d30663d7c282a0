/**
 * @file FileArtifactStore.hpp
 * @brief ArtifactStore that keeps one file per artifact in an output directory.
 */

#pragma once

#include "domain/ArtifactStore.hpp"
#include <filesystem>

namespace timenotes::infrastructure {

/**
 * @class FileArtifactStore
 * @brief Stores artifacts as `<outputDir>/<jobId><suffix>`.
 *
 * Job ids that are not safe file tokens are rejected and never reach the filesystem.
 */
class FileArtifactStore : public domain::ArtifactStore {
public:
    explicit FileArtifactStore(std::filesystem::path outputDir);

    bool write(const std::string& jobId, domain::ArtifactKind kind, const std::string& content) override;
    bool exists(const std::string& jobId, domain::ArtifactKind kind) const override;
    bool hasAny(const std::string& jobId) const override;
    std::optional<std::string> read(const std::string& jobId, domain::ArtifactKind kind) const override;

    /** @brief Path an artifact would be stored at, or empty for unsafe ids. */
    std::filesystem::path PathFor(const std::string& jobId, domain::ArtifactKind kind) const;

    const std::filesystem::path& GetOutputDir() const { return m_outputDir; }

private:
    std::filesystem::path m_outputDir;
};

} // namespace timenotes::infrastructure

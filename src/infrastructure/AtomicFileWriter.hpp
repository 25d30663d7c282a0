/**
 * @file AtomicFileWriter.hpp
 * @brief Whole-file writes that never leave a half-written target behind.
 */

#pragma once
#include <filesystem>
#include <string>

namespace timenotes::infrastructure {

/**
 * @class AtomicFileWriter
 * @brief Writes content to a sibling temp file, then renames it over the target.
 */
class AtomicFileWriter {
public:
    /**
     * @brief Atomically replaces @p target with @p content.
     * @return false if any step failed; the previous file is left untouched.
     */
    static bool Write(const std::filesystem::path& target, const std::string& content);
};

} // namespace timenotes::infrastructure

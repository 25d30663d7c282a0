/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <system_error>

namespace timenotes::infrastructure {

namespace fs = std::filesystem;

namespace {
std::atomic<unsigned long> g_tempCounter{0};
}

bool AtomicFileWriter::Write(const fs::path& target, const std::string& content) {
    // filename.<timestamp>.<n>.tmp, unique per call even within one clock tick
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = target;
    tempPath += "." + std::to_string(timestamp) + "." + std::to_string(g_tempCounter++) + ".tmp";

    std::error_code ec;
    if (target.has_parent_path() && !fs::exists(target.parent_path(), ec)) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            std::cerr << "[AtomicFileWriter] Error creating directories: " << ec.message() << std::endl;
            return false;
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[AtomicFileWriter] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[AtomicFileWriter] Write failed during output: " << tempPath << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::rename(tempPath, target, ec);
    if (ec) {
        std::cerr << "[AtomicFileWriter] Rename failed: " << ec.message() << std::endl;
        std::error_code cleanupEc;
        fs::remove(tempPath, cleanupEc);
        return false;
    }
    return true;
}

} // namespace timenotes::infrastructure

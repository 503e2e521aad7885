/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>

namespace ssdverifier::infrastructure {

namespace fs = std::filesystem;

bool AtomicFileWriter::Write(const std::string& filename, const std::string& content, std::string& error) {
    fs::path finalPath = filename;

    // Unique temp path: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    std::error_code ec;
    if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path(), ec)) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            error = "Error creating directories for " + finalPath.string() + ": " + ec.message();
            return false;
        }
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            error = "Failed to open temp file: " + tempPath.string();
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            error = "Write failed during output: " + tempPath.string();
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        error = "Rename failed: " + ec.message();
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

} // namespace ssdverifier::infrastructure

/**
 * @file AtomicFileWriter.hpp
 * @brief Atomic (temp file + rename) text file writes.
 */

#pragma once
#include <string>

namespace ssdverifier::infrastructure {

/**
 * @class AtomicFileWriter
 * @brief Writes a file so that readers see either the old or the complete new content.
 */
class AtomicFileWriter {
public:
    /**
     * @brief Writes @p content to @p filename through a temporary sibling file.
     * @param filename Destination path. Missing parent directories are created.
     * @param content Full file content.
     * @param error Receives a description of the failure, if any.
     * @return true on success.
     */
    static bool Write(const std::string& filename, const std::string& content, std::string& error);
};

} // namespace ssdverifier::infrastructure

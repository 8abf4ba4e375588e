#pragma once
#include <string>

/**
 * @brief Whole-file read and crash-safe replace.
 *
 * write() fills a temporary file beside the target and renames it over the
 * target, so readers see either the old or the new content. The target's
 * permission bits carry over to the replacement.
 */
namespace AtomicFile {
    // Throws CortexError(NotFound / IoError)
    std::string read(const std::string& path);

    // Throws CortexError(IoError); the temporary file never outlives a failure
    void write(const std::string& path, const std::string& content);
}

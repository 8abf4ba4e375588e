#pragma once
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Per-job log file shared by the drain threads and the supervisor.
 *
 * Lines are flushed as they arrive so a concurrent tail sees live output.
 */
class JobLog {
public:
    // Creates (truncates) the file. Throws CortexError(IoError).
    explicit JobLog(const std::string& path);

    void writeHeader(const std::string& jobId, const std::string& command, uint64_t startedAt);
    void appendLine(const std::string& prefix, const std::string& line);
    void writeFooter(uint64_t finishedAt, uint64_t durationSecs, const std::string& statusLabel);

    const std::string& path() const { return logPath; }

    // Last `n` non-empty lines; empty when the file is unreadable
    static std::vector<std::string> tail(const std::string& path, size_t n);

private:
    std::string logPath;
    std::ofstream out;
    std::mutex mtx;
};

#include "jobs/JobLog.h"
#include "core/Errors.h"
#include "utils/TimeUtils.h"
#include <deque>
#include <filesystem>

namespace {
const char* kTag = "[cortex-act] ";
}

JobLog::JobLog(const std::string& path) : logPath(path) {
    out.open(std::filesystem::u8path(path), std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw CortexError(ErrorKind::IoError, "Failed to create log file " + path);
    }
}

void JobLog::writeHeader(const std::string& jobId, const std::string& command, uint64_t startedAt) {
    std::lock_guard<std::mutex> lock(mtx);
    out << kTag << "job_id=" << jobId << "\n"
        << kTag << "command=" << command << "\n"
        << kTag << "started=" << TimeUtils::formatUtc(startedAt) << "\n"
        << kTag << "---" << std::endl;
}

void JobLog::appendLine(const std::string& prefix, const std::string& line) {
    std::lock_guard<std::mutex> lock(mtx);
    out << prefix << line << std::endl;
}

void JobLog::writeFooter(uint64_t finishedAt, uint64_t durationSecs, const std::string& statusLabel) {
    std::lock_guard<std::mutex> lock(mtx);
    out << kTag << "---\n"
        << kTag << "finished=" << TimeUtils::formatUtc(finishedAt) << "\n"
        << kTag << "duration=" << durationSecs << "s\n"
        << kTag << "status=" << statusLabel << std::endl;
}

std::vector<std::string> JobLog::tail(const std::string& path, size_t n) {
    std::ifstream in(std::filesystem::u8path(path));
    if (!in) return {};

    std::deque<std::string> window;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        window.push_back(line);
        if (window.size() > n) window.pop_front();
    }
    return std::vector<std::string>(window.begin(), window.end());
}

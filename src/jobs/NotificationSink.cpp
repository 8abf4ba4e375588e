#include "jobs/NotificationSink.h"
#include "utils/Logger.h"
#include "utils/TimeUtils.h"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

NotificationSink::NotificationSink(const std::string& path) : ledgerPath(path) {}

std::string NotificationSink::formatBlock(const Job& job) {
    std::string stateLabel;
    switch (job.state.kind) {
        case JobState::Kind::Done:
            stateLabel = "DONE (exit " + std::to_string(job.state.exitCode) + ")";
            break;
        case JobState::Kind::Failed:
            stateLabel = "FAILED - " + job.state.reason;
            break;
        default:
            stateLabel = "UNKNOWN";
    }

    uint64_t finished = job.finishedAt ? *job.finishedAt : TimeUtils::nowUnix();
    uint64_t duration = finished > job.startedAt ? finished - job.startedAt : 0;

    std::ostringstream block;
    block << "\n## [" << stateLabel << "] " << job.jobId << " - " << TimeUtils::formatUtc(finished) << "\n"
          << "\n"
          << "- **Command:** `" << job.command << "`\n"
          << "- **Duration:** " << duration << " s\n"
          << "- **Log:** `" << job.logPath << "`\n"
          << "\n"
          << "---\n";
    return block.str();
}

void NotificationSink::append(const Job& job) {
    std::string block = formatBlock(job);

    std::lock_guard<std::mutex> lock(mtx);
    fs::path p = fs::u8path(ledgerPath);
    std::error_code ec;
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
    }
    std::ofstream out(p, std::ios::app);
    if (!out) {
        Logger::getInstance().warn("Cannot append notification to " + ledgerPath);
        return;
    }
    out << block;
}

#include "jobs/RetentionSweeper.h"
#include "utils/Logger.h"
#include <filesystem>

RetentionSweeper::RetentionSweeper(std::shared_ptr<JobRegistry> registry, uint64_t maxAgeSecs)
    : registry(std::move(registry)), maxAgeSecs(maxAgeSecs) {}

size_t RetentionSweeper::sweep(uint64_t now) {
    std::vector<Job> stale = registry->removeOlderThan(now, maxAgeSecs);
    for (const auto& job : stale) {
        std::error_code ec;
        std::filesystem::remove(std::filesystem::u8path(job.logPath), ec);
        if (ec) {
            Logger::getInstance().debug("Could not delete log " + job.logPath + ": " + ec.message());
        }
    }
    if (!stale.empty()) {
        Logger::getInstance().info("Swept " + std::to_string(stale.size()) + " expired job(s)");
    }
    return stale.size();
}

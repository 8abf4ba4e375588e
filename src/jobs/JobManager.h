#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "jobs/JobRegistry.h"
#include "jobs/JobTypes.h"
#include "jobs/NotificationSink.h"
#include "jobs/RetentionSweeper.h"

/**
 * @brief Runs shell commands as detached background jobs.
 *
 * Each job is `sh -c <command>` in its own process group. Two drain threads
 * copy stdout and stderr into <data_dir>/jobs/<id>.log; a supervisor thread
 * polls for exit or timeout, records the terminal state and appends to
 * notifications.md, then waits for the drains and writes the footer. Group
 * members that outlive the shell are still killed at the deadline. spawn()
 * never waits on any of them.
 */
class JobManager {
public:
    struct Options {
        std::string dataDir;
        uint64_t retentionSecs = 86400;
        int pollIntervalMs = 200;
    };

    explicit JobManager(const Options& options,
                        std::shared_ptr<JobRegistry> registry = std::make_shared<JobRegistry>());

    /** @throws CortexError SpawnFailed, IoError */
    SpawnResult spawn(const std::string& command, const std::optional<std::string>& cwd, uint64_t timeoutSecs);

    /** @throws CortexError NotFound */
    CheckResult check(const std::string& jobId) const;

    /**
     * SIGTERM to the job's process group; marks it Failed("killed by user").
     * A job that is not running yields a message, not an error.
     * @throws CortexError NotFound
     */
    std::string kill(const std::string& jobId);

    std::shared_ptr<JobRegistry> getRegistry() const { return registry; }
    std::string jobsDir() const;
    std::string notificationsPath() const;

private:
    Options options;
    std::shared_ptr<JobRegistry> registry;
    std::shared_ptr<NotificationSink> notifications;
    RetentionSweeper sweeper;

    static std::string nextJobId(uint64_t now);
};

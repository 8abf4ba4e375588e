#pragma once
#include <cstdint>
#include <memory>
#include "jobs/JobRegistry.h"

/**
 * @brief Drops jobs older than the retention window and deletes their logs.
 *
 * Runs synchronously; running processes of swept jobs are left alone.
 */
class RetentionSweeper {
public:
    RetentionSweeper(std::shared_ptr<JobRegistry> registry, uint64_t maxAgeSecs);

    // Returns the number of records removed.
    size_t sweep(uint64_t now);

    uint64_t maxAge() const { return maxAgeSecs; }

private:
    std::shared_ptr<JobRegistry> registry;
    uint64_t maxAgeSecs;
};

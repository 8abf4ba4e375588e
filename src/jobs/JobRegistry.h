#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "jobs/JobTypes.h"

/**
 * @brief Job id -> Job table behind a single mutex.
 *
 * Accessors hand out copies; nobody holds a reference into the table, and no
 * I/O happens while the lock is held.
 */
class JobRegistry {
public:
    void insert(const Job& job);

    std::optional<Job> get(const std::string& jobId) const;
    bool contains(const std::string& jobId) const;
    size_t size() const;

    // Sets a terminal state and finish time. Returns the updated copy, or nullopt if the id is gone.
    std::optional<Job> finish(const std::string& jobId, const JobState& state, uint64_t finishedAt);

    // Removes every job with now - startedAt > maxAgeSecs and returns the removed records.
    std::vector<Job> removeOlderThan(uint64_t now, uint64_t maxAgeSecs);

private:
    mutable std::mutex mtx;
    std::unordered_map<std::string, Job> jobs;
};

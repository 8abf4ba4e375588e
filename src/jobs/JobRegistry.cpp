#include "jobs/JobRegistry.h"

void JobRegistry::insert(const Job& job) {
    std::lock_guard<std::mutex> lock(mtx);
    jobs[job.jobId] = job;
}

std::optional<Job> JobRegistry::get(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = jobs.find(jobId);
    if (it == jobs.end()) return std::nullopt;
    return it->second;
}

bool JobRegistry::contains(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mtx);
    return jobs.count(jobId) > 0;
}

size_t JobRegistry::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return jobs.size();
}

std::optional<Job> JobRegistry::finish(const std::string& jobId, const JobState& state, uint64_t finishedAt) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = jobs.find(jobId);
    if (it == jobs.end()) return std::nullopt;
    it->second.state = state;
    it->second.finishedAt = finishedAt;
    return it->second;
}

std::vector<Job> JobRegistry::removeOlderThan(uint64_t now, uint64_t maxAgeSecs) {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<Job> removed;
    for (auto it = jobs.begin(); it != jobs.end();) {
        uint64_t age = now > it->second.startedAt ? now - it->second.startedAt : 0;
        if (age > maxAgeSecs) {
            removed.push_back(std::move(it->second));
            it = jobs.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

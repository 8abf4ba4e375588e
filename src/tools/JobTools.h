#pragma once
#include "ITool.h"
#include <cstdint>

class JobManager;

/**
 * @brief run_async: start a shell command in the background, return its job id at once.
 */
class RunAsyncTool : public ITool {
public:
    RunAsyncTool(JobManager& jobs, uint64_t defaultTimeoutSecs);

    std::string getName() const override { return "run_async"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    JobManager& jobs;
    uint64_t defaultTimeoutSecs;
};

class CheckJobTool : public ITool {
public:
    explicit CheckJobTool(JobManager& jobs);

    std::string getName() const override { return "check_job"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    JobManager& jobs;
};

class KillJobTool : public ITool {
public:
    explicit KillJobTool(JobManager& jobs);

    std::string getName() const override { return "kill_job"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    JobManager& jobs;
};

#include "JobTools.h"
#include "core/Errors.h"
#include "jobs/JobManager.h"

namespace {

nlohmann::json jobIdSchema(const std::string& description) {
    return {
        {"type", "object"},
        {"properties", {
            {"job_id", {{"type", "string"}, {"description", description}}}
        }},
        {"required", {"job_id"}}
    };
}

} // namespace

RunAsyncTool::RunAsyncTool(JobManager& jobs, uint64_t defaultTimeoutSecs)
    : jobs(jobs), defaultTimeoutSecs(defaultTimeoutSecs) {}

std::string RunAsyncTool::getDescription() const {
    return "Run a shell command as a background job. Returns immediately with job_id; poll with check_job. "
           "Use for long builds, test suites or anything that may exceed the request timeout.";
}

nlohmann::json RunAsyncTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"command", {{"type", "string"}, {"description", "Shell command to execute."}}},
            {"cwd", {{"type", "string"}, {"description", "Working directory. Default: server cwd."}}},
            {"timeout_secs", {{"type", "integer"}, {"description", "Hard timeout in seconds."},
                              {"default", defaultTimeoutSecs}}}
        }},
        {"required", {"command"}}
    };
}

nlohmann::json RunAsyncTool::execute(const nlohmann::json& args) {
    if (!args.contains("command") || !args["command"].is_string()) {
        return errorResult("'command' required");
    }
    std::string command = args["command"].get<std::string>();

    std::optional<std::string> cwd;
    if (args.contains("cwd") && args["cwd"].is_string()) {
        cwd = args["cwd"].get<std::string>();
    }

    uint64_t timeoutSecs = defaultTimeoutSecs;
    if (args.contains("timeout_secs") && !args["timeout_secs"].is_null()) {
        const auto& t = args["timeout_secs"];
        if (!t.is_number_integer() || (!t.is_number_unsigned() && t.get<int64_t>() <= 0) || t.get<uint64_t>() == 0) {
            return errorResult("'timeout_secs' must be a positive integer");
        }
        timeoutSecs = t.get<uint64_t>();
    }

    try {
        return textResult(jobs.spawn(command, cwd, timeoutSecs).toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    } catch (const CortexError& e) {
        return errorResult(std::string("run_async failed: ") + e.what());
    }
}

CheckJobTool::CheckJobTool(JobManager& jobs) : jobs(jobs) {}

std::string CheckJobTool::getDescription() const {
    return "Poll a background job started by run_async. Returns status (running/done/failed), exit code, "
           "duration_secs and the last 20 lines of output (log_tail).";
}

nlohmann::json CheckJobTool::getSchema() const {
    return jobIdSchema("Job ID from run_async.");
}

nlohmann::json CheckJobTool::execute(const nlohmann::json& args) {
    if (!args.contains("job_id") || !args["job_id"].is_string()) {
        return errorResult("'job_id' required");
    }
    try {
        return textResult(jobs.check(args["job_id"].get<std::string>()).toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    } catch (const CortexError& e) {
        return errorResult(std::string("check_job failed: ") + e.what());
    }
}

KillJobTool::KillJobTool(JobManager& jobs) : jobs(jobs) {}

std::string KillJobTool::getDescription() const {
    return "Terminate a background job (SIGTERM to its process group). No-op if the job already finished.";
}

nlohmann::json KillJobTool::getSchema() const {
    return jobIdSchema("Job ID to terminate.");
}

nlohmann::json KillJobTool::execute(const nlohmann::json& args) {
    if (!args.contains("job_id") || !args["job_id"].is_string()) {
        return errorResult("'job_id' required");
    }
    try {
        return textResult(jobs.kill(args["job_id"].get<std::string>()));
    } catch (const CortexError& e) {
        return errorResult(std::string("kill_job failed: ") + e.what());
    }
}

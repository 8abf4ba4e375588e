#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Lifecycle of a background job.
 *
 * Queued -> Running -> Done(exit code) | Failed(reason). Terminal states are
 * only ever overwritten by the kill/exit race (a user kill followed by the
 * supervisor observing the exit).
 */
struct JobState {
    enum class Kind {
        Queued,
        Running,
        Done,
        Failed
    };

    Kind kind = Kind::Queued;
    int exitCode = 0;      // Done only; -1 when the process died from a signal
    std::string reason;    // Failed only

    static JobState queued() { return JobState{}; }
    static JobState running() { return JobState{Kind::Running, 0, ""}; }
    static JobState done(int code) { return JobState{Kind::Done, code, ""}; }
    static JobState failed(const std::string& why) { return JobState{Kind::Failed, 0, why}; }

    const char* label() const {
        switch (kind) {
            case Kind::Queued: return "queued";
            case Kind::Running: return "running";
            case Kind::Done: return "done";
            case Kind::Failed: return "failed";
        }
        return "unknown";
    }

    bool isTerminal() const { return kind == Kind::Done || kind == Kind::Failed; }

    bool operator==(const JobState& other) const {
        return kind == other.kind && exitCode == other.exitCode && reason == other.reason;
    }
    bool operator!=(const JobState& other) const { return !(*this == other); }
};

struct Job {
    std::string jobId;
    std::string command;
    std::optional<int> pid;
    JobState state;
    uint64_t startedAt = 0;               // unix seconds
    std::optional<uint64_t> finishedAt;
    std::string logPath;
};

struct SpawnResult {
    std::string jobId;
    std::optional<int> pid;
    std::string logPath;
    std::string message;

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["job_id"] = jobId;
        j["pid"] = pid ? nlohmann::json(*pid) : nlohmann::json(nullptr);
        j["log_path"] = logPath;
        j["message"] = message;
        return j;
    }
};

struct CheckResult {
    std::string jobId;
    std::string status;
    std::optional<int> pid;
    std::optional<int> exitCode;          // set for Done only
    uint64_t durationSecs = 0;
    std::vector<std::string> logTail;     // last <= 20 non-empty lines
    std::string logPath;

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["job_id"] = jobId;
        j["status"] = status;
        j["pid"] = pid ? nlohmann::json(*pid) : nlohmann::json(nullptr);
        j["exit_code"] = exitCode ? nlohmann::json(*exitCode) : nlohmann::json(nullptr);
        j["duration_secs"] = durationSecs;
        j["log_tail"] = logTail;
        j["log_path"] = logPath;
        return j;
    }
};

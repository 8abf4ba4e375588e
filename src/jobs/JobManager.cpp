#include "jobs/JobManager.h"
#include "core/Errors.h"
#include "jobs/JobLog.h"
#include "utils/Logger.h"
#include "utils/TimeUtils.h"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::atomic<uint64_t> jobCounter{0};

constexpr std::chrono::seconds kDrainGrace{2};

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Copies one pipe into the log, line by line, until EOF.
void drainPipe(int fd, std::shared_ptr<JobLog> log, const std::string& prefix,
               std::shared_ptr<std::atomic<int>> openDrains) {
    std::string pending;
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        pending.append(buffer, static_cast<size_t>(n));
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            log->appendLine(prefix, line);
            pending.erase(0, pos + 1);
        }
    }
    if (!pending.empty()) {
        log->appendLine(prefix, pending);
    }
    ::close(fd);
    openDrains->fetch_sub(1);
}

// Signals the whole group; falls back to the leader if the group is gone.
void signalJob(int pid, int sig) {
    if (::kill(-pid, sig) != 0) {
        ::kill(pid, sig);
    }
}

} // namespace

JobManager::JobManager(const Options& options, std::shared_ptr<JobRegistry> registry)
    : options(options),
      registry(registry ? std::move(registry) : std::make_shared<JobRegistry>()),
      notifications(std::make_shared<NotificationSink>(
          (fs::u8path(options.dataDir) / "notifications.md").u8string())),
      sweeper(this->registry, options.retentionSecs) {}

std::string JobManager::jobsDir() const {
    return (fs::u8path(options.dataDir) / "jobs").u8string();
}

std::string JobManager::notificationsPath() const {
    return notifications->path();
}

std::string JobManager::nextJobId(uint64_t now) {
    std::ostringstream id;
    id << "job_" << std::hex << now << std::dec << "_" << jobCounter.fetch_add(1);
    return id.str();
}

SpawnResult JobManager::spawn(const std::string& command, const std::optional<std::string>& cwd, uint64_t timeoutSecs) {
    sweeper.sweep(TimeUtils::nowUnix());

    std::error_code ec;
    fs::create_directories(fs::u8path(jobsDir()), ec);
    if (ec) {
        throw CortexError(ErrorKind::IoError, "Failed to create " + jobsDir() + ": " + ec.message());
    }

    if (cwd && !fs::is_directory(fs::u8path(*cwd), ec)) {
        throw CortexError(ErrorKind::SpawnFailed, "Working directory does not exist: " + *cwd);
    }

    uint64_t startedAt = TimeUtils::nowUnix();
    std::string jobId = nextJobId(startedAt);
    std::string logPath = (fs::u8path(jobsDir()) / (jobId + ".log")).u8string();

    auto log = std::make_shared<JobLog>(logPath);
    log->writeHeader(jobId, command, startedAt);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe(outPipe) != 0) {
        throw CortexError(ErrorKind::SpawnFailed, std::string("pipe failed: ") + std::strerror(errno));
    }
    if (::pipe(errPipe) != 0) {
        int err = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        throw CortexError(ErrorKind::SpawnFailed, std::string("pipe failed: ") + std::strerror(err));
    }

    // Everything the child touches is prepared before fork
    std::string workDir = cwd ? *cwd : std::string();

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        throw CortexError(ErrorKind::SpawnFailed, "Failed to spawn command: " + command + ": " + std::strerror(err));
    }

    if (pid == 0) { // Child
        ::setpgid(0, 0);
        if (!workDir.empty() && ::chdir(workDir.c_str()) != 0) {
            _exit(126);
        }
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::close(devNull);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        ::close(errPipe[0]);
        ::close(errPipe[1]);
        execl("/bin/sh", "sh", "-c", command.c_str(), (char*)NULL);
        _exit(127);
    }

    // Parent
    ::setpgid(pid, pid);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    Job job;
    job.jobId = jobId;
    job.command = command;
    job.pid = static_cast<int>(pid);
    job.state = JobState::running();
    job.startedAt = startedAt;
    job.logPath = logPath;
    registry->insert(job);

    auto openDrains = std::make_shared<std::atomic<int>>(2);
    std::thread stdoutDrain(drainPipe, outPipe[0], log, "[stdout] ", openDrains);
    std::thread stderrDrain(drainPipe, errPipe[0], log, "[stderr] ", openDrains);

    auto sharedRegistry = registry;
    auto sink = notifications;
    int pollMs = options.pollIntervalMs > 0 ? options.pollIntervalMs : 200;

    std::thread([jobId, pid, startedAt, timeoutSecs, pollMs, log, sharedRegistry, sink, openDrains,
                 outThread = std::move(stdoutDrain), errThread = std::move(stderrDrain)]() mutable {
        using Clock = std::chrono::steady_clock;
        auto start = Clock::now();
        auto poll = std::chrono::milliseconds(pollMs);
        // Clamped to ten years so the duration cannot overflow
        auto limit = std::chrono::seconds(static_cast<int64_t>(std::min<uint64_t>(timeoutSecs, 315360000)));
        bool groupKilled = false;
        JobState finalState;
        while (true) {
            int status = 0;
            pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid) {
                finalState = JobState::done(WIFEXITED(status) ? WEXITSTATUS(status) : -1);
                break;
            }
            if (r < 0) {
                if (errno == EINTR) continue;
                finalState = JobState::failed(std::string("wait error: ") + std::strerror(errno));
                break;
            }
            if (Clock::now() - start > limit) {
                signalJob(pid, SIGKILL);
                groupKilled = true;
                ::waitpid(pid, &status, 0);
                finalState = JobState::failed("timeout after " + std::to_string(timeoutSecs) + "s");
                break;
            }
            std::this_thread::sleep_for(poll);
        }

        // Output written just before the exit is usually still in the pipes
        auto flushDeadline = Clock::now() + poll;
        while (openDrains->load() > 0 && Clock::now() < flushDeadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        // Recorded before the pipes close; a backgrounded child may hold them until the deadline
        uint64_t finishedAt = TimeUtils::nowUnix();
        std::optional<Job> snapshot = sharedRegistry->finish(jobId, finalState, finishedAt);
        if (snapshot) {
            sink->append(*snapshot);
        }
        Logger::getInstance().info("Job " + jobId + " finished: " + finalState.label());

        // Leftover group members still answer to the deadline. The leader is reaped, so only
        // the group is signalled; its id cannot be reused while a member is alive.
        auto killedAt = Clock::now();
        while (openDrains->load() > 0) {
            auto now = Clock::now();
            if (!groupKilled && now - start > limit) {
                ::kill(-pid, SIGKILL);
                groupKilled = true;
                killedAt = now;
            } else if (groupKilled && now - killedAt > kDrainGrace) {
                break;
            }
            std::this_thread::sleep_for(poll);
        }

        if (openDrains->load() == 0) {
            outThread.join();
            errThread.join();
        } else {
            // Something outside the group still holds a pipe
            Logger::getInstance().warn("Job " + jobId + ": output pipes still open after kill, detaching readers");
            outThread.detach();
            errThread.detach();
        }

        uint64_t duration = finishedAt > startedAt ? finishedAt - startedAt : 0;
        log->writeFooter(finishedAt, duration, finalState.label());
    }).detach();

    Logger::getInstance().action("Job " + jobId + " started (pid=" + std::to_string(pid) + "): " + command);

    SpawnResult result;
    result.jobId = jobId;
    result.pid = static_cast<int>(pid);
    result.logPath = logPath;
    result.message = "Job " + jobId + " started (pid=" + std::to_string(pid) +
                     "). Poll with check_job. Log: " + logPath;
    return result;
}

CheckResult JobManager::check(const std::string& jobId) const {
    std::optional<Job> job = registry->get(jobId);
    if (!job) {
        throw CortexError(ErrorKind::NotFound,
                          "Job '" + jobId + "' not found. It may have been cleaned up (24 h TTL).");
    }

    uint64_t end = job->finishedAt ? *job->finishedAt : TimeUtils::nowUnix();

    CheckResult result;
    result.jobId = job->jobId;
    result.status = job->state.label();
    result.pid = job->pid;
    if (job->state.kind == JobState::Kind::Done) {
        result.exitCode = job->state.exitCode;
    }
    result.durationSecs = end > job->startedAt ? end - job->startedAt : 0;
    result.logTail = JobLog::tail(job->logPath, 20);
    result.logPath = job->logPath;
    return result;
}

std::string JobManager::kill(const std::string& jobId) {
    std::optional<Job> job = registry->get(jobId);
    if (!job) {
        throw CortexError(ErrorKind::NotFound, "Job '" + jobId + "' not found.");
    }
    if (job->state.kind != JobState::Kind::Running) {
        return "Job " + jobId + " is not running (state: " + job->state.label() + "). Nothing to kill.";
    }

    if (job->pid) {
        signalJob(*job->pid, SIGTERM);
    }
    registry->finish(jobId, JobState::failed("killed by user"), TimeUtils::nowUnix());
    Logger::getInstance().action("Killed job " + jobId);

    std::string pidText = job->pid ? std::to_string(*job->pid) : std::string("none");
    return "Sent SIGTERM to job " + jobId + " (pid=" + pidText + "). Marked as failed.";
}

#pragma once
#include <mutex>
#include <string>
#include "jobs/JobTypes.h"

/**
 * @brief Append-only Markdown ledger of finished jobs (notifications.md).
 */
class NotificationSink {
public:
    explicit NotificationSink(const std::string& path);

    // Best effort: failures are logged, never thrown.
    void append(const Job& job);

    static std::string formatBlock(const Job& job);

    const std::string& path() const { return ledgerPath; }

private:
    std::string ledgerPath;
    std::mutex mtx;
};

#include "utils/Logger.h"
#include <iostream>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <unistd.h>

// ANSI Color Codes
namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string GREEN = "\033[38;5;46m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";

    const char* levelTag(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR: return "[ERROR] ";
            case LogLevel::WARNING: return "[WARN] ";
            case LogLevel::INFO: return "[INFO] ";
            case LogLevel::SUCCESS: return "[OK] ";
            case LogLevel::ACTION: return "[ACTION] ";
            default: return "[DEBUG] ";
        }
    }
}

void Logger::writeToFile(LogLevel level, const std::string& message) {
    if (logFilePath.empty()) return;
    std::ofstream logFile(logFilePath, std::ios::app);
    if (!logFile.is_open()) return;

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tmBuf{};
    localtime_r(&now, &tmBuf);
    logFile << std::put_time(&tmBuf, "[%Y-%m-%d %H:%M:%S] ") << levelTag(level) << message << std::endl;
}

void Logger::printToConsole(LogLevel level, const std::string& message) {
    static const bool useColor = isatty(STDERR_FILENO) != 0;

    std::string prefix;
    std::string color;
    switch (level) {
        case LogLevel::ACTION:
            color = YELLOW + BOLD;
            prefix = "[Action] ";
            break;
        case LogLevel::INFO:
            color = CYAN;
            prefix = "[Info] ";
            break;
        case LogLevel::SUCCESS:
            color = GREEN;
            prefix = "[OK] ";
            break;
        case LogLevel::WARNING:
            color = YELLOW;
            prefix = "[Warn] ";
            break;
        case LogLevel::ERROR:
            color = RED + BOLD;
            prefix = "[Error] ";
            break;
        case LogLevel::DEBUG:
            color = GRAY;
            prefix = "[Debug] ";
            break;
    }
    if (useColor) {
        prefix = color + prefix + RESET;
    }

    // Trim trailing newlines from message to avoid double spacing
    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    // Multi-line messages get the prefix on every line
    std::stringstream ss(trimmedMsg);
    std::string line;
    while (std::getline(ss, line)) {
        std::cerr << "[cortex-act] " << prefix << line << std::endl;
    }
}

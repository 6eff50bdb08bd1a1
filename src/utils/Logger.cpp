#include "utils/Logger.h"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <cctype>

// ANSI Color Codes
namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";
}

bool Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mtx);
    if (logFile.is_open()) {
        logFile.close();
    }
    if (path.empty()) return true;
    logFile.open(path, std::ios::app);
    return logFile.is_open();
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF: return "OFF";
    }
    return "INFO";
}

LogLevel Logger::parseLevel(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "0" || lower == "trace") return LogLevel::TRACE;
    if (lower == "1" || lower == "debug") return LogLevel::DEBUG;
    if (lower == "2" || lower == "info") return LogLevel::INFO;
    if (lower == "3" || lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "4" || lower == "error") return LogLevel::ERROR;
    if (lower == "5" || lower == "off") return LogLevel::OFF;
    throw std::runtime_error("Unknown log level: " + value);
}

void Logger::writeToFile(LogLevel level, const std::string& message) {
    if (!logFile.is_open()) return;

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    logFile << std::put_time(&local, "[%Y-%m-%d %H:%M:%S] ");
    logFile << "[" << levelName(level) << "] " << message << std::endl;
}

void Logger::printToConsole(LogLevel level, const std::string& message) {
    std::string prefix;
    switch (level) {
        case LogLevel::TRACE:
            prefix = GRAY + "[Trace] " + RESET;
            break;
        case LogLevel::DEBUG:
            prefix = GRAY + "[Debug] " + RESET;
            break;
        case LogLevel::INFO:
            prefix = CYAN + "[Info] " + RESET;
            break;
        case LogLevel::WARNING:
            prefix = YELLOW + "⚠ " + RESET;
            break;
        case LogLevel::ERROR:
            prefix = RED + BOLD + "✖ " + RESET;
            break;
        case LogLevel::OFF:
            return;
    }

    // Trim trailing newlines from message to avoid double spacing
    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    // stdout belongs to the protocol streams, so the console sink is stderr
    std::stringstream ss(trimmedMsg);
    std::string line;
    bool first = true;
    while (std::getline(ss, line)) {
        if (first) {
            std::cerr << prefix << line << std::endl;
        } else {
            std::cerr << GRAY << "  │ " << RESET << line << std::endl;
        }
        first = false;
    }
}

#pragma once
#include <string>
#include <functional>
#include <mutex>
#include <fstream>

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    OFF = 5
};

class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx);
        minLevel = level;
    }

    LogLevel getLevel() const { return minLevel; }

    // Opens (append mode) the file sink. An empty path closes it.
    bool setLogFile(const std::string& path);

    void setConsoleEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        consoleEnabled = enabled;
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        if (level < minLevel || level == LogLevel::OFF) return;

        writeToFile(level, message);
        if (consoleEnabled) {
            printToConsole(level, message);
        }
        if (callback) {
            callback(level, message);
        }
    }

    // Convenience methods
    void trace(const std::string& m) { log(LogLevel::TRACE, m); }
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }

    // "2", "debug", "WARN" ...; throws std::runtime_error on unknown input
    static LogLevel parseLevel(const std::string& value);
    static const char* levelName(LogLevel level);

private:
    Logger() = default;
    LogCallback callback;
    std::mutex mtx;
    LogLevel minLevel = LogLevel::INFO;
    bool consoleEnabled = true;
    std::ofstream logFile;

    void writeToFile(LogLevel level, const std::string& message);
    void printToConsole(LogLevel level, const std::string& message);
};

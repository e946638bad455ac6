#pragma once

#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace zk {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg) { log(LogLevel::INFO, msg); }
    void warning(const std::string& msg) { log(LogLevel::WARNING, msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel get_min_level() const { return min_level_; }

protected:
    LogLevel min_level_ = LogLevel::INFO;
};

/**
 * Writes prefixed lines to a stream, stderr by default.
 * stdout is reserved for protocol responses in serve mode.
 * Lines from the watcher threads and the request loop are serialized.
 */
class ConsoleLogger : public Logger {
public:
    explicit ConsoleLogger(std::ostream& out = std::cerr) : out_(out) {}

    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;

        const char* prefix = "";
        switch (level) {
            case LogLevel::DEBUG:   prefix = "[DEBUG] "; break;
            case LogLevel::INFO:    prefix = "[INFO] "; break;
            case LogLevel::WARNING: prefix = "[WARN] "; break;
            case LogLevel::ERROR:   prefix = "[ERROR] "; break;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        out_ << prefix << message << std::endl;
    }

private:
    std::ostream& out_;
    std::mutex mutex_;
};

class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&) override {}
};

/**
 * Parse a level name (debug, info, warning, error).
 * Unknown names fall back to INFO.
 */
inline LogLevel parse_log_level(const std::string& name) {
    if (name == "debug" || name == "trace") return LogLevel::DEBUG;
    if (name == "warning" || name == "warn") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * Create the process logger. Level is read from $ZK_LOG unless verbose.
 */
inline std::shared_ptr<Logger> make_console_logger(bool verbose = false) {
    auto logger = std::make_shared<ConsoleLogger>();
    if (verbose) {
        logger->set_min_level(LogLevel::DEBUG);
    } else if (const char* level = std::getenv("ZK_LOG")) {
        logger->set_min_level(parse_log_level(level));
    }
    return logger;
}

// Substitute a NullLogger for a missing logger
inline std::shared_ptr<Logger> or_null_logger(std::shared_ptr<Logger> logger) {
    if (logger) return logger;
    return std::make_shared<NullLogger>();
}

}  // namespace zk

#pragma once
#include <map>
#include <mutex>
#include <string>

// PSR-3 levels, most severe first.
enum class LogLevel {
    Emergency,
    Alert,
    Critical,
    Error,
    Warning,
    Notice,
    Info,
    Debug
};

using LogContext = std::map<std::string, std::string>;

const char* level_name(LogLevel level);

// Replaces each {key} in message with ctx[key]; unknown placeholders are kept.
std::string interpolate(const std::string& message, const LogContext& ctx);

class Logger {
public:
    virtual ~Logger() = default;
    virtual void log(LogLevel level, const std::string& message, const LogContext& ctx = {}) = 0;
};

// Writes "[tag] LEVEL message" lines; warning and above go to stderr.
class ConsoleLogger : public Logger {
public:
    explicit ConsoleLogger(std::string tag, LogLevel threshold = LogLevel::Notice);
    void log(LogLevel level, const std::string& message, const LogContext& ctx = {}) override;

    void set_threshold(LogLevel threshold);

private:
    std::string tag_;
    LogLevel threshold_;
    std::mutex mtx_;
};

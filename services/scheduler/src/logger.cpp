#include "../include/logger.hpp"
#include <iostream>

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Emergency: return "EMERGENCY";
        case LogLevel::Alert: return "ALERT";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Notice: return "NOTICE";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
    }
    return "UNKNOWN";
}

std::string interpolate(const std::string& message, const LogContext& ctx) {
    std::string out;
    out.reserve(message.size());
    std::size_t pos = 0;
    while (pos < message.size()) {
        std::size_t open = message.find('{', pos);
        if (open == std::string::npos) break;
        std::size_t close = message.find('}', open + 1);
        if (close == std::string::npos) break;
        out.append(message, pos, open - pos);
        auto it = ctx.find(message.substr(open + 1, close - open - 1));
        if (it != ctx.end()) {
            out += it->second;
        } else {
            out.append(message, open, close - open + 1);
        }
        pos = close + 1;
    }
    out.append(message, pos, std::string::npos);
    return out;
}

ConsoleLogger::ConsoleLogger(std::string tag, LogLevel threshold)
    : tag_(std::move(tag)), threshold_(threshold) {}

void ConsoleLogger::set_threshold(LogLevel threshold) {
    std::lock_guard<std::mutex> lock(mtx_);
    threshold_ = threshold;
}

void ConsoleLogger::log(LogLevel level, const std::string& message, const LogContext& ctx) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (level > threshold_) return;
    std::ostream& os = level <= LogLevel::Warning ? std::cerr : std::cout;
    os << "[" << tag_ << "] " << level_name(level) << " " << interpolate(message, ctx) << std::endl;
}

#include "logging.hpp"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <vector>

namespace zeldwallet {

namespace {

const char* category_name(LogCategory category) {
    switch (category) {
        case LogCategory::KEYS: return "keys";
        case LogCategory::SIGNING: return "signing";
        case LogCategory::STORAGE: return "storage";
        case LogCategory::WALLET: return "wallet";
        default: return "all";
    }
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::LVL_ERROR: return "ERROR";
        case LogLevel::LVL_WARN: return "WARN";
        case LogLevel::LVL_INFO: return "INFO";
        case LogLevel::LVL_DEBUG: return "DEBUG";
    }
    return "?";
}

} // namespace

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::enable_category(LogCategory category) {
    categories_ |= static_cast<uint32_t>(category);
}

void Logger::disable_category(LogCategory category) {
    categories_ &= ~static_cast<uint32_t>(category);
}

bool Logger::is_enabled(LogCategory category, LogLevel level) const {
    if (static_cast<int>(level) > static_cast<int>(level_.load())) {
        return false;
    }
    return (categories_.load() & static_cast<uint32_t>(category)) != 0;
}

bool Logger::set_log_file(const std::string& path) {
    auto stream = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!stream->is_open()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    file_ = std::move(stream);
    return true;
}

std::string Logger::format_line(LogCategory category, LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &now);
#else
    gmtime_r(&now, &tm_buf);
#endif
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);

    std::string line = stamp;
    line += " [";
    line += level_name(level);
    line += "] [";
    line += category_name(category);
    line += "] ";
    line += message;
    return line;
}

void Logger::log(LogCategory category, LogLevel level, const std::string& message) {
    if (!is_enabled(category, level)) {
        return;
    }
    std::string line = format_line(category, level, message);

    std::lock_guard<std::mutex> lock(mutex_);
    if (console_) {
        std::cerr << line << std::endl;
    }
    if (file_) {
        *file_ << line << std::endl;
    }
}

void Logger::log_format(LogCategory category, LogLevel level, const char* format, ...) {
    if (!is_enabled(category, level)) {
        return;
    }

    va_list args;
    va_start(args, format);
    va_list args_copy;
    va_copy(args_copy, args);
    int needed = std::vsnprintf(nullptr, 0, format, args_copy);
    va_end(args_copy);

    std::string message;
    if (needed > 0) {
        std::vector<char> buffer(static_cast<size_t>(needed) + 1);
        std::vsnprintf(buffer.data(), buffer.size(), format, args);
        message.assign(buffer.data(), static_cast<size_t>(needed));
    }
    va_end(args);

    log(category, level, message);
}

bool Logger::parse_level(const std::string& name, LogLevel& level) {
    if (name == "error") { level = LogLevel::LVL_ERROR; return true; }
    if (name == "warn") { level = LogLevel::LVL_WARN; return true; }
    if (name == "info") { level = LogLevel::LVL_INFO; return true; }
    if (name == "debug") { level = LogLevel::LVL_DEBUG; return true; }
    return false;
}

} // namespace zeldwallet

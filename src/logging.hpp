#pragma once

#include <atomic>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace zeldwallet {

// Log categories, one per component
enum class LogCategory : uint32_t {
    NONE = 0,
    KEYS = (1 << 0),     // Seed handling and derivation
    SIGNING = (1 << 1),  // Message and PSBT signing
    STORAGE = (1 << 2),  // Encrypted store and backups
    WALLET = (1 << 3),   // Session lifecycle
    ALL = 0xFFFFFFFF
};

// LVL_ prefix keeps clear of platform ERROR macros
enum class LogLevel {
    LVL_ERROR = 0,
    LVL_WARN = 1,
    LVL_INFO = 2,
    LVL_DEBUG = 3
};

// Process-wide logger. Writes to stderr and, when configured, a log file.
// Callers must never pass secret material (mnemonics, passwords, keys).
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }

    void enable_category(LogCategory category);
    void disable_category(LogCategory category);
    bool is_enabled(LogCategory category, LogLevel level) const;

    void set_console_logging(bool enable) { console_ = enable; }

    // Opens (appends to) a log file; returns false if it cannot be opened
    bool set_log_file(const std::string& path);

    void log(LogCategory category, LogLevel level, const std::string& message);
    void log_format(LogCategory category, LogLevel level, const char* format, ...);

    static bool parse_level(const std::string& name, LogLevel& level);

private:
    Logger() = default;

    std::string format_line(LogCategory category, LogLevel level, const std::string& message) const;

    std::atomic<uint32_t> categories_{static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<LogLevel> level_{LogLevel::LVL_WARN};
    std::atomic<bool> console_{true};
    std::unique_ptr<std::ofstream> file_;
    std::mutex mutex_;
};

} // namespace zeldwallet

#define ZELDWALLET_LOG(category, level, format, ...) \
    ::zeldwallet::Logger::instance().log_format(::zeldwallet::LogCategory::category, \
        ::zeldwallet::LogLevel::LVL_##level, format, ##__VA_ARGS__)

#define LogPrintKeys(level, format, ...) ZELDWALLET_LOG(KEYS, level, format, ##__VA_ARGS__)
#define LogPrintSigning(level, format, ...) ZELDWALLET_LOG(SIGNING, level, format, ##__VA_ARGS__)
#define LogPrintStorage(level, format, ...) ZELDWALLET_LOG(STORAGE, level, format, ##__VA_ARGS__)
#define LogPrintWallet(level, format, ...) ZELDWALLET_LOG(WALLET, level, format, ##__VA_ARGS__)

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace logging {

// logger names, one per engine component
constexpr const char* MAIN_LOGGER = "dbshift";
constexpr const char* DIFF_LOGGER = "diff";
constexpr const char* GENERATOR_LOGGER = "generator";
constexpr const char* EXECUTOR_LOGGER = "executor";
constexpr const char* LEDGER_LOGGER = "ledger";
constexpr const char* BACKUP_LOGGER = "backup";
constexpr const char* SQL_LOGGER = "sql";

enum class Level {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

struct LogConfig {
    Level level { Level::Info };
    std::string pattern { "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v" };
    bool console { true };
    std::string file_path;
    size_t max_file_size { 10 * 1024 * 1024 };
    size_t max_files { 3 };
};

// Initialize logging once; later calls are ignored until shutdown()
void init(const LogConfig& config = LogConfig {});

// Get a logger by name, creates it on first use
std::shared_ptr<spdlog::logger> get(const std::string& name = MAIN_LOGGER);

bool is_level_enabled(Level level);

// unknown names map to Info
Level parse_level(const std::string& level);

void flush();

// Flush and drop every logger; the next init() applies its own config
void shutdown();

spdlog::level::level_enum to_spdlog_level(Level level);

// Component logger, checks the runtime level before formatting
class Logger {
public:
    explicit Logger(std::string name)
        : name_(std::move(name)) { }

    template <typename... Args>
    void trace(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Trace)) get(name_)->trace(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Debug)) get(name_)->debug(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Info)) get(name_)->info(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Warn)) get(name_)->warn(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Error)) get(name_)->error(fmt, std::forward<Args>(args)...);
    }

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

} // namespace logging

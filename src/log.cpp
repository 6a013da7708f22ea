#include "log.hpp"
#include <atomic>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace logging {

namespace {

std::mutex g_mutex;
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;
LogConfig g_config;
bool g_initialized = false;
std::atomic<Level> g_current_level { Level::Info };

std::shared_ptr<spdlog::logger> create_logger(const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;
    auto lvl = to_spdlog_level(g_config.level);

    if (g_config.console) {
        // log to stderr so command output on stdout stays clean
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(lvl);
        sinks.push_back(console_sink);
    }
    if (!g_config.file_path.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            g_config.file_path, g_config.max_file_size, g_config.max_files);
        file_sink->set_level(lvl);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(lvl);
    logger->set_pattern(g_config.pattern);
    return logger;
}

} // anonymous namespace

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
    case Level::Trace: return spdlog::level::trace;
    case Level::Debug: return spdlog::level::debug;
    case Level::Info: return spdlog::level::info;
    case Level::Warn: return spdlog::level::warn;
    case Level::Error: return spdlog::level::err;
    case Level::Critical: return spdlog::level::critical;
    case Level::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

Level parse_level(const std::string& level) {
    if (level == "trace") return Level::Trace;
    if (level == "debug") return Level::Debug;
    if (level == "info") return Level::Info;
    if (level == "warn" || level == "warning") return Level::Warn;
    if (level == "error" || level == "err") return Level::Error;
    if (level == "critical" || level == "crit") return Level::Critical;
    if (level == "off") return Level::Off;
    return Level::Info;
}

void init(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_initialized) return;

    g_config = config;
    g_current_level.store(config.level, std::memory_order_relaxed);
    g_loggers[MAIN_LOGGER] = create_logger(MAIN_LOGGER);
    g_initialized = true;
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_initialized) {
        g_loggers[MAIN_LOGGER] = create_logger(MAIN_LOGGER);
        g_initialized = true;
    }
    auto it = g_loggers.find(name);
    if (it != g_loggers.end()) return it->second;

    auto logger = create_logger(name);
    g_loggers[name] = logger;
    return logger;
}

bool is_level_enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(g_current_level.load(std::memory_order_relaxed));
}

void flush() {
    std::lock_guard<std::mutex> lock(g_mutex);
    for (auto& [name, logger] : g_loggers) logger->flush();
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    for (auto& [name, logger] : g_loggers) logger->flush();
    g_loggers.clear();
    g_initialized = false;
}

} // namespace logging

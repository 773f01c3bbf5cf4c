#include "logging.h"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>

namespace invsense {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;

}  // namespace

void InitLogging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger) {
        return;
    }
    std::vector<spdlog::sink_ptr> sinks;
    const auto level = static_cast<spdlog::level::level_enum>(config.level);

    spdlog::sink_ptr console_sink;
    if (config.console_to_stderr) {
        console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    console_sink->set_level(level);
    sinks.push_back(console_sink);

    if (config.enable_file) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size,
            config.max_files
        );
        file_sink->set_level(level);
        sinks.push_back(file_sink);
    }

    g_logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    g_logger->set_level(level);
    g_logger->set_pattern(config.pattern);

    spdlog::set_default_logger(g_logger);
    g_logger->flush_on(spdlog::level::warn);
}

std::shared_ptr<spdlog::logger> GetLogger() {
    if (!g_logger) {
        InitLogging();
    }
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    if (g_logger) {
        const auto spd_level = static_cast<spdlog::level::level_enum>(level);
        for (auto& sink : g_logger->sinks()) {
            sink->set_level(spd_level);
        }
        g_logger->set_level(spd_level);
    }
}

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::kTrace;
    if (lowered == "debug") return LogLevel::kDebug;
    if (lowered == "info") return LogLevel::kInfo;
    if (lowered == "warn" || lowered == "warning") return LogLevel::kWarn;
    if (lowered == "error") return LogLevel::kError;
    if (lowered == "critical") return LogLevel::kCritical;
    if (lowered == "off") return LogLevel::kOff;
    return std::nullopt;
}

void FlushLogs() {
    if (g_logger) {
        g_logger->flush();
    }
}

void ShutdownLogging() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger) {
        g_logger->flush();
        spdlog::shutdown();
        g_logger.reset();
    }
}

}  // namespace invsense

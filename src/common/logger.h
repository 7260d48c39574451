#pragma once

#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace c4::sddp {

// ---------------------------------------------------------------------------
// Logger categories matching engine subsystems
// ---------------------------------------------------------------------------
namespace LogCategory {
    inline constexpr const char* ENDPOINT = "ENDPOINT";
    inline constexpr const char* SEARCH   = "SEARCH";
    inline constexpr const char* SERVER   = "SERVER";
    inline constexpr const char* CONFIG   = "CONFIG";
    inline constexpr const char* MAIN     = "MAIN";
} // namespace LogCategory

namespace detail {
// Optional rotating log file shared by every category logger.
inline spdlog::sink_ptr& fileSink() {
    static spdlog::sink_ptr sink;
    return sink;
}
} // namespace detail

// ---------------------------------------------------------------------------
// Get or create a named logger with standard formatting.
// Console output goes to stderr; stdout belongs to the CLI's JSON records.
// ---------------------------------------------------------------------------
inline std::shared_ptr<spdlog::logger> getLogger(const std::string& name) {
    auto logger = spdlog::get(name);
    if (logger) {
        return logger;
    }

    std::vector<spdlog::sink_ptr> sinks;
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);
    sinks.push_back(console_sink);

    if (detail::fileSink()) {
        sinks.push_back(detail::fileSink());
    }

    logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%n] [%^%l%$] %v");
    logger->set_level(spdlog::get_level());
    logger->flush_on(spdlog::level::warn);

    spdlog::register_logger(logger);
    return logger;
}

// ---------------------------------------------------------------------------
// Set the global level (and optional log file) for loggers created afterwards
// and for those already registered.
// ---------------------------------------------------------------------------
inline void initLogging(const std::string& level_str, const std::string& log_file = "") {
    if (!log_file.empty() && !detail::fileSink()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file,
            5 * 1024 * 1024, // 5 MB per file
            3                 // keep 3 rotated files
        );
        file_sink->set_level(spdlog::level::trace);
        detail::fileSink() = file_sink;
        spdlog::apply_all([&file_sink](std::shared_ptr<spdlog::logger> logger) {
            logger->sinks().push_back(file_sink);
        });
    }
    spdlog::set_level(spdlog::level::from_str(level_str));
}

} // namespace c4::sddp

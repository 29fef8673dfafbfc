#include "Log.h"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

void islandgen::logsys::init_console_logs(spdlog::level::level_enum level,
                                          const std::optional<fs::path>& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (logFile) {
        if (logFile->has_parent_path()) {
            std::error_code ec; fs::create_directories(logFile->parent_path(), ec);
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile->string(), 1 << 20, 4)); // 1MB * 4
    }
    auto logger = std::make_shared<spdlog::logger>("islandgen", sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::set_default_logger(std::move(logger));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
    spdlog::debug("Logging started");
}

std::optional<spdlog::level::level_enum> islandgen::logsys::parse_level(std::string_view name) noexcept {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn")     return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    return std::nullopt;
}

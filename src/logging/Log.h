#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <spdlog/spdlog.h>

namespace islandgen::logsys {
    // Installs the "islandgen" logger as spdlog's default: colored stderr, plus a
    // rotating file sink when `logFile` is given (1MB * 4).
    void init_console_logs(spdlog::level::level_enum level,
                           const std::optional<std::filesystem::path>& logFile = std::nullopt);

    // trace|debug|info|warn|error|critical|off (case-sensitive)
    std::optional<spdlog::level::level_enum> parse_level(std::string_view name) noexcept;
}

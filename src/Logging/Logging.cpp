#include "Logging.hpp"
#include "../Config/Config.hpp"
#include <algorithm>
#include <cctype>

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
    std::string level_str = name;
    std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                  [](unsigned char c) { return std::tolower(c); });

    if (level_str == "trace") {
        return spdlog::level::trace;
    } else if (level_str == "debug") {
        return spdlog::level::debug;
    } else if (level_str == "info") {
        return spdlog::level::info;
    } else if (level_str == "warn" || level_str == "warning") {
        return spdlog::level::warn;
    } else if (level_str == "error") {
        return spdlog::level::err;
    } else if (level_str == "critical") {
        return spdlog::level::critical;
    } else if (level_str == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

void applyLogging(const Config& config) {
    spdlog::set_pattern(config.getLogPattern());

    auto level = parseLogLevel(config.getLogLevel());
    if (!level.has_value()) {
        spdlog::warn("[Logging] Unknown log level '{}', using info", config.getLogLevel());
    }
    spdlog::set_level(level.value_or(spdlog::level::info));
}

#pragma once

#include <spdlog/spdlog.h>
#include <optional>
#include <string>

class Config;

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name);

// Applies the configured pattern and level to spdlog's default logger.
void applyLogging(const Config& config);

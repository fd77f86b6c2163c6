#include "Config.hpp"
#include "../Logging/Logging.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <yaml-cpp/yaml.h>

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() {
    setDefaults();
}

void Config::setDefaults() {
    executor_threads_ = 4;
    log_level_ = "info";
    log_pattern_ = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    valid_ = true;
    error_message_.clear();
}

bool Config::fail(const std::string& message) {
    error_message_ = message;
    spdlog::error("[Config] Failed to load config: {}", error_message_);
    valid_ = false;
    return false;
}

bool Config::loadFromFile(const std::string& config_path) {
    setDefaults();
    try {
        YAML::Node config_node = YAML::LoadFile(config_path);
        return parseYaml(config_node);
    } catch (const YAML::BadFile& e) {
        spdlog::warn("[Config] Config file '{}' not found, using defaults", config_path);
        return true;
    } catch (const YAML::Exception& e) {
        return fail("YAML parse error: " + std::string(e.what()));
    }
}

bool Config::loadFromString(const std::string& yaml_content) {
    setDefaults();
    try {
        YAML::Node config_node = YAML::Load(yaml_content);
        return parseYaml(config_node);
    } catch (const YAML::Exception& e) {
        return fail("YAML parse error: " + std::string(e.what()));
    }
}

bool Config::parseYaml(const YAML::Node& config) {
    try {
        if (config["singleflight"]) {
            const auto& singleflight = config["singleflight"];
            if (singleflight["executor_threads"]) {
                int threads = singleflight["executor_threads"].as<int>();
                if (threads <= 0) {
                    return fail("singleflight.executor_threads must be positive, got " +
                                std::to_string(threads));
                }
                executor_threads_ = static_cast<unsigned int>(threads);
            }
        }
        
        if (config["logging"]) {
            const auto& logging = config["logging"];
            if (logging["level"]) {
                std::string level = logging["level"].as<std::string>();
                if (!parseLogLevel(level).has_value()) {
                    return fail("unknown logging.level '" + level + "'");
                }
                log_level_ = level;
            }
            if (logging["pattern"]) {
                log_pattern_ = logging["pattern"].as<std::string>();
            }
        }
        
        valid_ = true;
        error_message_.clear();
        
        spdlog::info("[Config] Configuration loaded successfully from YAML");
        return true;
        
    } catch (const YAML::Exception& e) {
        return fail("YAML parse error: " + std::string(e.what()));
    } catch (const std::exception& e) {
        return fail("Config error: " + std::string(e.what()));
    }
}

#pragma once

#include <string>
#include <yaml-cpp/yaml.h>

class Config {
public:
    static Config& getInstance();
    
    bool loadFromFile(const std::string& config_path = "config.yaml");
    bool loadFromString(const std::string& yaml_content);
    
    unsigned int getExecutorThreads() const { return executor_threads_; }
    
    std::string getLogLevel() const { return log_level_; }
    std::string getLogPattern() const { return log_pattern_; }
    
    bool isValid() const { return valid_; }
    std::string getError() const { return error_message_; }
    
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

private:
    Config();
    
    void setDefaults();
    bool parseYaml(const YAML::Node& config);
    bool fail(const std::string& message);
    
    unsigned int executor_threads_ = 4;
    
    std::string log_level_ = "info";
    std::string log_pattern_ = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    
    bool valid_ = false;
    std::string error_message_;
};

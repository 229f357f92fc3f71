#pragma once
#include <amzstream/core/config/app_config.hpp>
#include <string>

class ConfigLoader {
public:
    /**
     * @brief Load and validate a YAML configuration file
     * @throws std::runtime_error if the file is missing, a required field is
     *         absent, or a field has the wrong type or an out-of-range value
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
};

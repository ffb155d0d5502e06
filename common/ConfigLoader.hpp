#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json_fwd.hpp>
#include "DeviceConfig.hpp"

namespace lan_watch::common
{
    inline constexpr int MIN_SCAN_INTERVAL_SECONDS = 5;
    inline constexpr const char *DEFAULT_CONFIG_PATH = "config/devices.yaml";

    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class ConfigLoader
    {
    public:
        // Throws ConfigError on malformed JSON or invalid device entries.
        static AppConfig Parse(const std::string &text);

        // Same document structure written as YAML.
        static AppConfig ParseYaml(const std::string &text);

        // .yaml and .yml files are read as YAML, anything else as JSON.
        // A missing file is not an error: it yields an empty device list.
        static AppConfig LoadFile(const std::string &path);

        // CONFIG_PATH selects the file unless pathOverride is set,
        // SCAN_INTERVAL overrides the file's interval.
        static AppConfig LoadFromEnvironment(const std::optional<std::string> &pathOverride = std::nullopt);

        static bool IsValidIPv4(const std::string &ip);

    private:
        static AppConfig FromDocument(const nlohmann::json &root);
    };
}

#include "ConfigLoader.hpp"
#include <nlohmann/json.hpp>
#include <fkYAML/node.hpp>
#include <arpa/inet.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>

namespace lan_watch::common
{
    namespace
    {
        using nlohmann::json;

        std::string GetString(const json &obj, const char *key, const std::string &fallback = "")
        {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null())
                return fallback;
            if (!it->is_string())
                throw ConfigError(std::string("field '") + key + "' must be a string");
            return it->get<std::string>();
        }

        int GetInt(const json &obj, const char *key, int fallback)
        {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null())
                return fallback;
            if (!it->is_number_integer())
                throw ConfigError(std::string("field '") + key + "' must be an integer");
            return it->get<int>();
        }

        std::chrono::milliseconds GetMillis(const json &obj, const char *key, std::chrono::milliseconds fallback)
        {
            int value = GetInt(obj, key, static_cast<int>(fallback.count()));
            if (value <= 0)
                throw ConfigError(std::string("timeout '") + key + "' must be positive");
            return std::chrono::milliseconds(value);
        }

        std::string Lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        SshCredentials ParseSsh(const json &node, const std::string &deviceName)
        {
            if (!node.is_object())
                throw ConfigError("device '" + deviceName + "': ssh must be an object");

            SshCredentials ssh;
            ssh.host = GetString(node, "host");
            ssh.username = GetString(node, "username");
            ssh.secret = GetString(node, "password");

            int port = GetInt(node, "port", 22);
            if (port <= 0 || port > 65535)
                throw ConfigError("device '" + deviceName + "': ssh port out of range");
            ssh.port = static_cast<uint16_t>(port);

            if (ssh.username.empty() || ssh.secret.empty())
                throw ConfigError("device '" + deviceName + "': ssh needs username and password");
            return ssh;
        }

        Gns3Endpoint ParseGns3(const json &node, const std::string &deviceName)
        {
            if (!node.is_object())
                throw ConfigError("device '" + deviceName + "': gns3 must be an object");

            Gns3Endpoint endpoint;
            endpoint.base_url = GetString(node, "server_url");
            endpoint.token = GetString(node, "access_token");
            endpoint.token_type = Lower(GetString(node, "token_type", "bearer"));

            if (endpoint.base_url.empty())
                throw ConfigError("device '" + deviceName + "': gns3 needs server_url");
            while (!endpoint.base_url.empty() && endpoint.base_url.back() == '/')
                endpoint.base_url.pop_back();
            return endpoint;
        }

        // YAML tree to the JSON tree the rest of the loader reads.
        json FromYaml(fkyaml::node &node)
        {
            if (node.is_mapping())
            {
                json obj = json::object();
                for (auto it = node.begin(); it != node.end(); ++it)
                {
                    if (!it.key().is_string())
                        throw ConfigError("YAML mapping keys must be strings");
                    obj[it.key().get_value<std::string>()] = FromYaml(*it);
                }
                return obj;
            }
            if (node.is_sequence())
            {
                json arr = json::array();
                for (auto it = node.begin(); it != node.end(); ++it)
                    arr.push_back(FromYaml(*it));
                return arr;
            }
            if (node.is_boolean())
                return node.get_value<bool>();
            if (node.is_integer())
                return node.get_value<int64_t>();
            if (node.is_float_number())
                return node.get_value<double>();
            if (node.is_string())
                return node.get_value<std::string>();
            return nullptr;
        }

        bool HasYamlExtension(const std::string &path)
        {
            std::string lower = Lower(path);
            auto endsWith = [&lower](const std::string &suffix)
            {
                return lower.size() >= suffix.size() && lower.compare(lower.size() - suffix.size(), suffix.size(), suffix) == 0;
            };
            return endsWith(".yaml") || endsWith(".yml");
        }

        DeviceConfig ParseDevice(const json &node, size_t index)
        {
            if (!node.is_object())
                throw ConfigError("device #" + std::to_string(index) + " must be an object");

            DeviceConfig device;
            device.id = GetString(node, "id", std::to_string(index));
            device.name = GetString(node, "name", "device-" + std::to_string(index));
            device.ip = GetString(node, "ip");
            device.mac = Lower(GetString(node, "mac"));
            device.broadcast = GetString(node, "broadcast");

            if (device.ip.empty())
                throw ConfigError("device '" + device.name + "': ip is required");
            if (!ConfigLoader::IsValidIPv4(device.ip))
                throw ConfigError("device '" + device.name + "': invalid ip '" + device.ip + "'");
            if (!device.broadcast.empty() && !ConfigLoader::IsValidIPv4(device.broadcast))
                throw ConfigError("device '" + device.name + "': invalid broadcast '" + device.broadcast + "'");

            auto ssh = node.find("ssh");
            if (ssh != node.end() && !ssh->is_null() && !(ssh->is_object() && ssh->empty()))
                device.ssh = ParseSsh(*ssh, device.name);

            // "gns3key" is the older name of the block.
            auto gns3 = node.find("gns3");
            if (gns3 == node.end() || gns3->is_null())
                gns3 = node.find("gns3key");
            if (gns3 != node.end() && !gns3->is_null() && !(gns3->is_object() && gns3->empty()))
                device.gns3 = ParseGns3(*gns3, device.name);

            return device;
        }
    }

    bool ConfigLoader::IsValidIPv4(const std::string &ip)
    {
        in_addr addr{};
        return inet_pton(AF_INET, ip.c_str(), &addr) == 1;
    }

    AppConfig ConfigLoader::Parse(const std::string &text)
    {
        json root;
        try
        {
            root = json::parse(text);
        }
        catch (const json::parse_error &e)
        {
            throw ConfigError(std::string("malformed JSON: ") + e.what());
        }
        return FromDocument(root);
    }

    AppConfig ConfigLoader::ParseYaml(const std::string &text)
    {
        json root;
        try
        {
            fkyaml::node yaml = fkyaml::node::deserialize(text);
            root = FromYaml(yaml);
        }
        catch (const fkyaml::exception &e)
        {
            throw ConfigError(std::string("malformed YAML: ") + e.what());
        }
        // An empty file is an empty fleet.
        if (root.is_null())
            root = json::object();
        return FromDocument(root);
    }

    AppConfig ConfigLoader::FromDocument(const nlohmann::json &root)
    {
        if (!root.is_object())
            throw ConfigError("top-level value must be an object");

        AppConfig config;
        try
        {
            config.scan_interval_seconds = std::max(MIN_SCAN_INTERVAL_SECONDS,
                                                    GetInt(root, "scan_interval_seconds", config.scan_interval_seconds));
            config.cycle_deadline_seconds = GetInt(root, "cycle_deadline_seconds", config.scan_interval_seconds);
            if (config.cycle_deadline_seconds <= 0 || config.cycle_deadline_seconds > config.scan_interval_seconds)
                config.cycle_deadline_seconds = config.scan_interval_seconds;

            config.max_concurrency = GetInt(root, "max_concurrency", config.max_concurrency);
            if (config.max_concurrency < 1)
                throw ConfigError("max_concurrency must be at least 1");

            auto timeouts = root.find("timeouts_ms");
            if (timeouts != root.end() && timeouts->is_object())
            {
                config.timeouts.ping = GetMillis(*timeouts, "ping", config.timeouts.ping);
                config.timeouts.neighbor = GetMillis(*timeouts, "neighbor", config.timeouts.neighbor);
                config.timeouts.hostname = GetMillis(*timeouts, "hostname", config.timeouts.hostname);
                config.timeouts.ssh = GetMillis(*timeouts, "ssh", config.timeouts.ssh);
                config.timeouts.gns3 = GetMillis(*timeouts, "gns3", config.timeouts.gns3);
                config.timeouts.port = GetMillis(*timeouts, "port", config.timeouts.port);
            }

            auto devices = root.find("devices");
            if (devices != root.end() && !devices->is_null())
            {
                if (!devices->is_array())
                    throw ConfigError("devices must be an array");

                std::set<std::string> ids;
                for (size_t i = 0; i < devices->size(); ++i)
                {
                    DeviceConfig device = ParseDevice((*devices)[i], i);
                    if (!ids.insert(device.id).second)
                        throw ConfigError("duplicate device id '" + device.id + "'");
                    config.devices.push_back(std::move(device));
                }
            }
        }
        catch (const json::exception &e)
        {
            throw ConfigError(std::string("invalid configuration: ") + e.what());
        }

        return config;
    }

    AppConfig ConfigLoader::LoadFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            std::cerr << "[Config] " << path << " not found, starting with no devices.\n";
            return AppConfig{};
        }

        std::stringstream ss;
        ss << file.rdbuf();
        if (HasYamlExtension(path))
            return ParseYaml(ss.str());
        return Parse(ss.str());
    }

    AppConfig ConfigLoader::LoadFromEnvironment(const std::optional<std::string> &pathOverride)
    {
        std::string path = DEFAULT_CONFIG_PATH;
        if (pathOverride)
            path = *pathOverride;
        else if (const char *env = std::getenv("CONFIG_PATH"))
            path = env;

        AppConfig config = LoadFile(path);

        if (const char *env = std::getenv("SCAN_INTERVAL"))
        {
            try
            {
                int interval = std::max(MIN_SCAN_INTERVAL_SECONDS, std::stoi(env));
                if (config.cycle_deadline_seconds == config.scan_interval_seconds || config.cycle_deadline_seconds > interval)
                    config.cycle_deadline_seconds = interval;
                config.scan_interval_seconds = interval;
            }
            catch (const std::exception &)
            {
                throw ConfigError(std::string("SCAN_INTERVAL is not a number: '") + env + "'");
            }
        }

        return config;
    }
}

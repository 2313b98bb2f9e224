#include "load_config.hpp"
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace ConfigReader
{
    json load(const std::string &filepath)
    {
        std::ifstream config_file(filepath);
        if (!config_file.is_open())
        {
            MyLogger::error("Unable to open configuration file: " + filepath);
            throw std::runtime_error("Could not open config file: " + filepath);
        }

        try
        {
            json j;
            config_file >> j;
            MyLogger::info("Configuration file loaded successfully: " + filepath);
            return j;
        }
        catch (const json::parse_error &e)
        {
            MyLogger::error("JSON parse error in file " + filepath + ": " + e.what());
            throw std::runtime_error("Invalid JSON in config file: " + filepath);
        }
    }

    int get_config_value(const std::string &key, const json &j, int fallback)
    {
        if (!j.contains(key))
        {
            MyLogger::debug("Key not found in config, using default for: " + key);
            return fallback;
        }
        if (!j[key].is_number_integer())
        {
            MyLogger::error("Key is not an integer: " + key);
            throw std::runtime_error("Config key '" + key + "' must be an integer");
        }
        // Unsigned values above LLONG_MAX would wrap when read as long long.
        const bool too_large = j[key].is_number_unsigned() &&
                               j[key].get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<int>::max());
        auto val = too_large ? 0LL : j[key].get<long long>();
        if (too_large || val < std::numeric_limits<int>::min() || val > std::numeric_limits<int>::max())
        {
            MyLogger::error("Value for key '" + key + "' exceeds int limit");
            throw std::runtime_error("Config key '" + key + "' is out of range");
        }
        return static_cast<int>(val);
    }

    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback)
    {
        if (!j.contains(key))
        {
            MyLogger::debug("Key not found in config, using default for: " + key);
            return fallback;
        }
        if (!j[key].is_string())
        {
            MyLogger::error("Key is not a string: " + key);
            throw std::runtime_error("Config key '" + key + "' must be a string");
        }
        return j[key].get<std::string>();
    }

    unsigned short get_config_short(const std::string &key, const json &j, unsigned short fallback)
    {
        if (!j.contains(key))
        {
            MyLogger::debug("Key not found in config, using default for: " + key);
            return fallback;
        }
        if (!j[key].is_number_integer())
        {
            MyLogger::error("Key is not an unsigned integer: " + key);
            throw std::runtime_error("Config key '" + key + "' must be an unsigned integer");
        }
        auto val = j[key].get<long long>();
        if (val < 0 || val > std::numeric_limits<unsigned short>::max())
        {
            MyLogger::error("Value for key '" + key + "' exceeds unsigned short limit");
            throw std::runtime_error("Config key '" + key + "' is out of range");
        }
        return static_cast<unsigned short>(val);
    }

    std::optional<std::string> get_env(const std::string &name)
    {
        const char *value = std::getenv(name.c_str());
        if (value == nullptr || *value == '\0')
        {
            return std::nullopt;
        }
        return std::string(value);
    }
}

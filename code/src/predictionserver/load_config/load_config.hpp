#ifndef LOAD_CONFIG_HPP
#define LOAD_CONFIG_HPP

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "../logger/Mylogger.h"

using json = nlohmann::json;

namespace ConfigReader
{
    // Parses a JSON config file. Throws std::runtime_error if the file cannot be opened or parsed.
    json load(const std::string &filepath);

    // Typed lookups. A missing key yields the fallback; a key of the wrong type throws.
    int get_config_value(const std::string &key, const json &j, int fallback);
    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback);
    unsigned short get_config_short(const std::string &key, const json &j, unsigned short fallback);

    // Value of an environment variable, if set and non-empty.
    std::optional<std::string> get_env(const std::string &name);
}

#endif // LOAD_CONFIG_HPP

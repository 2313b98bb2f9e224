#include "initiation.hpp"
#include "../load_config/load_config.hpp"
#include "../logger/Mylogger.h"
#include <stdexcept>

namespace Initiation
{
    namespace
    {
        std::vector<Authentication::Credential> parse_users(const json &config)
        {
            if (!config.contains("users") || !config["users"].is_object() || config["users"].empty())
            {
                MyLogger::error("Config must define a non-empty 'users' object");
                throw std::runtime_error("Config key 'users' must be a non-empty object");
            }

            std::vector<Authentication::Credential> users;
            for (const auto &[username, password] : config["users"].items())
            {
                if (username.empty() || !password.is_string())
                {
                    MyLogger::error("Malformed entry in 'users': " + username);
                    throw std::runtime_error("Config 'users' entries must map a username to a password string");
                }
                users.push_back({username, password.get<std::string>()});
            }
            return users;
        }

        int parse_positive(const std::string &key, const std::string &raw)
        {
            try
            {
                std::size_t pos = 0;
                int value = std::stoi(raw, &pos);
                if (pos == raw.size() && value > 0)
                    return value;
            }
            catch (const std::exception &)
            {
                // fall through to the error below
            }
            throw std::runtime_error("Environment override " + key + " must be a positive integer");
        }
    }

    ServiceConfig from_json(const json &config)
    {
        ServiceConfig cfg;

        cfg.server_ip = ConfigReader::get_config_string("server_ip", config, cfg.server_ip);
        cfg.server_port = ConfigReader::get_config_short("server_port", config, cfg.server_port);
        cfg.jwt_issuer = ConfigReader::get_config_string("jwt_issuer", config, cfg.jwt_issuer);
        cfg.model_path = ConfigReader::get_config_string("model_path", config, cfg.model_path);
        cfg.log_level = ConfigReader::get_config_string("log_level", config, cfg.log_level);

        std::string secret = ConfigReader::get_config_string("jwt_secret", config, "");
        std::string algorithm = ConfigReader::get_config_string("jwt_algorithm", config, "HS256");
        int lifetime = ConfigReader::get_config_value("token_expire_minutes", config, 30);
        int workers = ConfigReader::get_config_value("worker_threads", config, 2);
        int timeout_ms = ConfigReader::get_config_value("predict_timeout_ms", config, 0);

        if (auto env = ConfigReader::get_env("ADMISSIONS_JWT_SECRET"))
        {
            MyLogger::info("Signing secret taken from ADMISSIONS_JWT_SECRET");
            secret = *env;
        }
        if (auto env = ConfigReader::get_env("ADMISSIONS_JWT_ALGORITHM"))
        {
            algorithm = *env;
        }
        if (auto env = ConfigReader::get_env("ADMISSIONS_TOKEN_EXPIRE_MINUTES"))
        {
            lifetime = parse_positive("ADMISSIONS_TOKEN_EXPIRE_MINUTES", *env);
        }
        if (auto env = ConfigReader::get_env("ADMISSIONS_LOG_LEVEL"))
        {
            cfg.log_level = *env;
        }

        if (secret.empty())
        {
            MyLogger::error("No JWT signing secret configured (jwt_secret / ADMISSIONS_JWT_SECRET)");
            throw std::runtime_error("Missing JWT signing secret");
        }
        cfg.jwt_secret = secret;

        try
        {
            cfg.jwt_algorithm = Authentication::algorithm_from_string(algorithm);
        }
        catch (const std::invalid_argument &e)
        {
            MyLogger::error(e.what());
            throw std::runtime_error(e.what());
        }

        if (lifetime <= 0)
        {
            throw std::runtime_error("token_expire_minutes must be positive");
        }
        cfg.token_lifetime = std::chrono::minutes(lifetime);

        if (workers <= 0)
        {
            throw std::runtime_error("worker_threads must be positive");
        }
        cfg.worker_threads = static_cast<std::size_t>(workers);

        if (timeout_ms < 0)
        {
            throw std::runtime_error("predict_timeout_ms must not be negative");
        }
        cfg.predict_timeout = std::chrono::milliseconds(timeout_ms);

        cfg.users = parse_users(config);

        MyLogger::info("Successfully initialized all config parameters.");
        return cfg;
    }

    ServiceConfig initialize(const std::string &config_path)
    {
        return from_json(ConfigReader::load(config_path));
    }
}

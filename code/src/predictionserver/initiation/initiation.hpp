#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../credential_store/credential_store.hpp"
#include "../token_codec/token_codec.hpp"

using json = nlohmann::json;

namespace Initiation
{
    // Process-wide settings, fixed once startup completes.
    struct ServiceConfig
    {
        std::string server_ip = "0.0.0.0";
        unsigned short server_port = 3000;

        std::string jwt_secret;
        Authentication::SigningAlgorithm jwt_algorithm = Authentication::SigningAlgorithm::HS256;
        std::string jwt_issuer = "admissions-service";
        std::chrono::minutes token_lifetime{30};

        std::vector<Authentication::Credential> users;

        std::string model_path = "config/model.json";
        std::size_t worker_threads = 2;
        std::chrono::milliseconds predict_timeout{0};

        std::string log_level = "info";
    };

    // Builds the config from a parsed document, then applies ADMISSIONS_* environment
    // overrides. Throws std::runtime_error on anything that must abort startup.
    ServiceConfig from_json(const json &config);

    // Loads the file at config_path and delegates to from_json.
    ServiceConfig initialize(const std::string &config_path);
}

// Internal modules
#include "./logger/Mylogger.h"
#include "./initiation/initiation.hpp"
#include "./token_codec/token_codec.hpp"
#include "./credential_store/credential_store.hpp"
#include "./authentication/authentication.hpp"
#include "./predictor/predictor.hpp"
#include "./prediction_runner/prediction_runner.hpp"
#include "./router/router.hpp"

// Third-party libraries
#include <httplib.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

std::atomic<bool> server_running(true);
httplib::Server *global_server = nullptr;

void shutdown_server(int)
{
    server_running = false;
    if (global_server)
    {
        global_server->stop();
    }
}

int main(int argc, char *argv[])
{
    std::string config_path = "config/server_config.json";
    if (argc > 2)
    {
        std::cerr << "Usage: " << argv[0] << " [server_config_path]" << std::endl;
        return 1;
    }
    if (argc == 2)
    {
        config_path = argv[1];
    }
    MyLogger::info("Using config file: " + config_path);

    Initiation::ServiceConfig config;
    std::unique_ptr<Prediction::LinearModel> model;
    try
    {
        config = Initiation::initialize(config_path);
        MyLogger::setLevel(MyLogger::levelFromString(config.log_level));
        model = std::make_unique<Prediction::LinearModel>(Prediction::LinearModel::from_file(config.model_path));
    }
    catch (const std::exception &e)
    {
        MyLogger::error("Initialization failed: " + std::string(e.what()));
        return 1;
    }

    Authentication::TokenCodec codec(config.jwt_secret, config.jwt_algorithm, config.jwt_issuer);
    Authentication::CredentialStore store(config.users);
    Authentication::AuthGate gate(codec, store, config.token_lifetime);
    MyLogger::info("Loaded " + std::to_string(store.size()) + " account(s); tokens signed with " +
                   Authentication::to_string(config.jwt_algorithm) + ", valid for " +
                   std::to_string(config.token_lifetime.count()) + " minute(s)");

    Prediction::PredictionRunner runner(*model, config.worker_threads);

    httplib::Server svr;
    global_server = &svr;
    signal(SIGINT, shutdown_server);
    signal(SIGTERM, shutdown_server);

    Router::ServiceRouter router(gate, runner, config.predict_timeout);
    router.mount(svr);

    MyLogger::info("Admissions prediction server running on " + config.server_ip + ":" +
                   std::to_string(config.server_port) + "...");
    if (!svr.listen(config.server_ip, config.server_port))
    {
        if (server_running)
        {
            MyLogger::error("Failed to start server on " + config.server_ip + ":" + std::to_string(config.server_port));
            return 1;
        }
    }

    global_server = nullptr;
    MyLogger::info("Server stopped successfully");
    return 0;
}

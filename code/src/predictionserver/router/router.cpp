#include "router.hpp"
#include "../features/features.hpp"
#include "../logger/Mylogger.h"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <optional>

using json = nlohmann::json;

namespace Router
{
    const char *const LOGIN_FAILED_MESSAGE = "Incorrect username or password";
    const char *const AUTH_FAILED_MESSAGE = "Authentication failed. Please provide a valid JWT token.";

    namespace
    {
        void send_error(httplib::Response &res, int status, const std::string &message)
        {
            res.status = status;
            res.set_content(json{{"error", message}}.dump(), "application/json");
        }
    }

    ServiceRouter::ServiceRouter(const Authentication::AuthGate &gate, Prediction::PredictionRunner &runner,
                                 std::chrono::milliseconds predict_timeout)
        : gate_(gate), runner_(runner), predict_timeout_(predict_timeout)
    {
    }

    void ServiceRouter::mount(httplib::Server &svr)
    {
        svr.set_logger([](const httplib::Request &req, const httplib::Response &res)
                       { MyLogger::info("Request: " + req.method + " " + req.path + " -> " + std::to_string(res.status)); });

        svr.Post("/login", [this](const httplib::Request &req, httplib::Response &res)
                 { login(req, res); });
        svr.Post("/predict", [this](const httplib::Request &req, httplib::Response &res)
                 { predict(req, res); });
        svr.Get("/health", [this](const httplib::Request &req, httplib::Response &res)
                { health(req, res); });
        svr.Post("/health", [this](const httplib::Request &req, httplib::Response &res)
                 { health(req, res); });
    }

    void ServiceRouter::login(const httplib::Request &req, httplib::Response &res) const
    {
        MyLogger::info("Received login request");
        try
        {
            json body = json::parse(req.body, nullptr, false);
            if (body.is_discarded() || !body.is_object())
            {
                MyLogger::warning("Login request body is not a JSON object");
                send_error(res, 400, "Invalid JSON format");
                return;
            }
            if (!body.contains("username") || !body["username"].is_string() ||
                !body.contains("password") || !body["password"].is_string())
            {
                MyLogger::warning("Missing username or password in request");
                send_error(res, 400, "username and password are required strings");
                return;
            }

            auto result = gate_.login(body["username"].get<std::string>(), body["password"].get<std::string>());
            if (!result.success)
            {
                send_error(res, 401, LOGIN_FAILED_MESSAGE);
                return;
            }

            res.status = 200;
            res.set_content(json{{"access_token", result.value}, {"token_type", "bearer"}}.dump(), "application/json");
        }
        catch (const std::exception &e)
        {
            MyLogger::error("Request error: " + std::string(e.what()));
            send_error(res, 500, "Server error");
        }
    }

    bool ServiceRouter::authenticate_request(const httplib::Request &req, httplib::Response &res, std::string &userID) const
    {
        std::optional<std::string> header;
        if (req.has_header("Authorization"))
        {
            header = req.get_header_value("Authorization");
        }

        auto result = gate_.authorize(header);
        if (!result.success)
        {
            // The specific reason stays in the log; clients always see one message.
            MyLogger::warning("Authentication failed: " + Authentication::to_string(result.err));
            res.set_header("WWW-Authenticate", "Bearer");
            send_error(res, 401, AUTH_FAILED_MESSAGE);
            return false;
        }

        userID = result.value;
        MyLogger::debug("Authenticated user: " + userID);
        return true;
    }

    void ServiceRouter::predict(const httplib::Request &req, httplib::Response &res)
    {
        MyLogger::info("Received prediction request");
        try
        {
            std::string userID;
            if (!authenticate_request(req, res, userID))
            {
                return;
            }

            json body = json::parse(req.body, nullptr, false);
            if (body.is_discarded())
            {
                MyLogger::warning("Prediction request body is not valid JSON");
                send_error(res, 400, "Invalid JSON format");
                return;
            }

            auto validation = Prediction::parse_features(body);
            if (!validation.success)
            {
                MyLogger::warning("Validation failed for " + validation.field + ": " + validation.message);
                res.status = 422;
                res.set_content(json{{"error", "Validation error"},
                                     {"field", validation.field},
                                     {"message", validation.message}}
                                    .dump(),
                                "application/json");
                return;
            }

            auto pending = runner_.submit(validation.record);
            auto outcome = pending.wait(predict_timeout_);
            if (!outcome.success)
            {
                MyLogger::error("Prediction failed for user " + userID + ": " + outcome.err);
                send_error(res, 500, "Prediction failed");
                return;
            }

            // The model is unbounded; the response is not.
            double chance = std::clamp(outcome.value, 0.0, 1.0);
            res.status = 200;
            res.set_content(json{{"chance_of_admit", chance}}.dump(), "application/json");
        }
        catch (const std::exception &e)
        {
            MyLogger::error("Request error: " + std::string(e.what()));
            send_error(res, 500, "Server error");
        }
    }

    void ServiceRouter::health(const httplib::Request &, httplib::Response &res) const
    {
        res.status = 200;
        res.set_content(R"({"status": "healthy"})", "application/json");
    }
}

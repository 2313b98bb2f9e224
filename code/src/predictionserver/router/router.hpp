#pragma once
#include <chrono>
#include <string>
#include <httplib.h>
#include "../authentication/authentication.hpp"
#include "../prediction_runner/prediction_runner.hpp"

namespace Router
{
    extern const char *const LOGIN_FAILED_MESSAGE;
    extern const char *const AUTH_FAILED_MESSAGE;

    // HTTP surface of the service: /login, /predict and /health.
    // Handlers are public so they can be driven without a listening socket.
    class ServiceRouter
    {
    public:
        ServiceRouter(const Authentication::AuthGate &gate, Prediction::PredictionRunner &runner,
                      std::chrono::milliseconds predict_timeout = std::chrono::milliseconds(0));

        // Registers the routes and the request logger on svr.
        void mount(httplib::Server &svr);

        void login(const httplib::Request &req, httplib::Response &res) const;
        void predict(const httplib::Request &req, httplib::Response &res);
        void health(const httplib::Request &req, httplib::Response &res) const;

    private:
        // Writes the 401 response itself when it returns false.
        bool authenticate_request(const httplib::Request &req, httplib::Response &res, std::string &userID) const;

        const Authentication::AuthGate &gate_;
        Prediction::PredictionRunner &runner_;
        std::chrono::milliseconds predict_timeout_;
    };
}

#include "predictor.hpp"
#include "../logger/Mylogger.h"
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace Prediction
{
    namespace
    {
        std::array<double, 7> read_vector(const json &model, const std::string &key)
        {
            if (!model.contains(key) || !model[key].is_array() || model[key].size() != 7)
            {
                throw std::runtime_error("Model key '" + key + "' must be an array of 7 numbers");
            }
            std::array<double, 7> out{};
            for (std::size_t i = 0; i < out.size(); ++i)
            {
                const auto &v = model[key][i];
                if (!v.is_number() || !std::isfinite(v.get<double>()))
                {
                    throw std::runtime_error("Model key '" + key + "' contains a non-numeric entry");
                }
                out[i] = v.get<double>();
            }
            return out;
        }
    }

    LinearModel::LinearModel(std::array<double, 7> coefficients, double intercept,
                             std::array<double, 7> mean, std::array<double, 7> scale)
        : coefficients_(coefficients), intercept_(intercept), mean_(mean), scale_(scale)
    {
        for (double s : scale_)
        {
            if (s == 0.0)
            {
                throw std::runtime_error("Model scale entries must be non-zero");
            }
        }
    }

    LinearModel LinearModel::from_json(const json &model)
    {
        if (!model.is_object())
        {
            throw std::runtime_error("Model document must be a JSON object");
        }

        if (model.contains("features"))
        {
            const auto &names = model["features"];
            if (!names.is_array() || names.size() != FEATURE_NAMES.size())
            {
                throw std::runtime_error("Model 'features' must list the 7 feature names");
            }
            for (std::size_t i = 0; i < FEATURE_NAMES.size(); ++i)
            {
                if (!names[i].is_string() || names[i].get<std::string>() != FEATURE_NAMES[i])
                {
                    throw std::runtime_error("Model feature " + std::to_string(i) + " must be " + FEATURE_NAMES[i]);
                }
            }
        }

        auto coefficients = read_vector(model, "coefficients");

        if (!model.contains("intercept") || !model["intercept"].is_number())
        {
            throw std::runtime_error("Model key 'intercept' must be a number");
        }
        double intercept = model["intercept"].get<double>();

        std::array<double, 7> mean{};
        std::array<double, 7> scale{};
        scale.fill(1.0);
        if (model.contains("scaler"))
        {
            mean = read_vector(model["scaler"], "mean");
            scale = read_vector(model["scaler"], "scale");
        }

        return LinearModel(coefficients, intercept, mean, scale);
    }

    LinearModel LinearModel::from_file(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            MyLogger::error("Failed to open model file: " + path);
            throw std::runtime_error("Failed to open model file: " + path);
        }

        json model;
        try
        {
            file >> model;
        }
        catch (const json::parse_error &e)
        {
            MyLogger::error("JSON parse error in model file " + path + ": " + e.what());
            throw std::runtime_error("Invalid JSON in model file: " + path);
        }

        auto linear = from_json(model);
        MyLogger::info("Loaded linear model from " + path);
        return linear;
    }

    double LinearModel::run(const FeatureRecord &record) const
    {
        const auto x = record.as_vector();
        double y = intercept_;
        for (std::size_t i = 0; i < x.size(); ++i)
        {
            y += coefficients_[i] * (x[i] - mean_[i]) / scale_[i];
        }
        return y;
    }
}

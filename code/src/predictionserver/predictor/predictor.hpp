#pragma once
#include <array>
#include <string>
#include <nlohmann/json.hpp>
#include "../features/features.hpp"

using json = nlohmann::json;

namespace Prediction
{
    // Black-box regression model. Implementations must be safe to call from
    // several threads at once.
    class Predictor
    {
    public:
        virtual ~Predictor() = default;
        virtual double run(const FeatureRecord &record) const = 0;
    };

    // Linear regression over the seven features, with optional standard scaling:
    // y = intercept + sum(coef[i] * (x[i] - mean[i]) / scale[i])
    class LinearModel : public Predictor
    {
    public:
        LinearModel(std::array<double, 7> coefficients, double intercept,
                    std::array<double, 7> mean, std::array<double, 7> scale);

        // Throws std::runtime_error when the document does not describe a valid model.
        static LinearModel from_json(const json &model);
        static LinearModel from_file(const std::string &path);

        double run(const FeatureRecord &record) const override;

    private:
        std::array<double, 7> coefficients_;
        double intercept_;
        std::array<double, 7> mean_;
        std::array<double, 7> scale_;
    };
}

#pragma once
#include <array>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace Prediction
{
    struct FeatureRecord
    {
        int gre_score;
        int toefl_score;
        int university_rating;
        double sop;
        double lor;
        double cgpa;
        int research;

        // Values in model input order (the order of FEATURE_NAMES).
        std::array<double, 7> as_vector() const;
    };

    // Wire names of the fields, in model input order.
    extern const std::array<const char *, 7> FEATURE_NAMES;

    struct ValidationResult
    {
        FeatureRecord record;
        std::string field;   // offending field, empty on success
        std::string message; // violated constraint, empty on success
        bool success;
    };

    // Builds a FeatureRecord from a JSON object and checks every declared bound.
    // Stops at the first offending field.
    ValidationResult parse_features(const json &body);
}

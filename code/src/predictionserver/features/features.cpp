#include "features.hpp"
#include <cmath>
#include <sstream>
#include <utility>

namespace Prediction
{
    const std::array<const char *, 7> FEATURE_NAMES = {
        "GRE_Score", "TOEFL_Score", "University_Rating", "SOP", "LOR", "CGPA", "Research"};

    std::array<double, 7> FeatureRecord::as_vector() const
    {
        return {static_cast<double>(gre_score),
                static_cast<double>(toefl_score),
                static_cast<double>(university_rating),
                sop,
                lor,
                cgpa,
                static_cast<double>(research)};
    }

    namespace
    {
        std::string bound_message(const std::string &field, double lo, double hi)
        {
            std::ostringstream oss;
            oss << field << " must be between " << lo << " and " << hi;
            return oss.str();
        }

        // Returns an empty string on success, otherwise the reason.
        std::string read_int(const json &body, const std::string &field, int lo, int hi, int &out)
        {
            if (!body.contains(field))
                return field + " is required";
            const auto &value = body[field];
            if (!value.is_number_integer())
                return field + " must be an integer";
            const auto raw = value.get<long long>();
            if (raw < lo || raw > hi)
                return bound_message(field, lo, hi);
            out = static_cast<int>(raw);
            return "";
        }

        std::string read_float(const json &body, const std::string &field, double lo, double hi, double &out)
        {
            if (!body.contains(field))
                return field + " is required";
            const auto &value = body[field];
            if (!value.is_number())
                return field + " must be a number";
            const double raw = value.get<double>();
            if (!std::isfinite(raw) || raw < lo || raw > hi)
                return bound_message(field, lo, hi);
            out = raw;
            return "";
        }
    }

    ValidationResult parse_features(const json &body)
    {
        ValidationResult result{{}, "", "", false};
        if (!body.is_object())
        {
            result.field = "body";
            result.message = "request body must be a JSON object";
            return result;
        }

        FeatureRecord &r = result.record;
        const auto fail = [&result](const char *field, std::string message)
        {
            result.field = field;
            result.message = std::move(message);
            return result;
        };

        std::string err;
        if (!(err = read_int(body, "GRE_Score", 0, 340, r.gre_score)).empty())
            return fail("GRE_Score", err);
        if (!(err = read_int(body, "TOEFL_Score", 0, 120, r.toefl_score)).empty())
            return fail("TOEFL_Score", err);
        if (!(err = read_int(body, "University_Rating", 1, 5, r.university_rating)).empty())
            return fail("University_Rating", err);
        if (!(err = read_float(body, "SOP", 1.0, 5.0, r.sop)).empty())
            return fail("SOP", err);
        if (!(err = read_float(body, "LOR", 1.0, 5.0, r.lor)).empty())
            return fail("LOR", err);
        if (!(err = read_float(body, "CGPA", 0.0, 10.0, r.cgpa)).empty())
            return fail("CGPA", err);
        if (!(err = read_int(body, "Research", 0, 1, r.research)).empty())
            return fail("Research", err);

        result.success = true;
        return result;
    }
}

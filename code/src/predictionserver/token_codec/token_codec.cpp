#include "token_codec.hpp"
#include "../logger/Mylogger.h"
#include <jwt-cpp/jwt.h>
#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace Authentication
{
    namespace
    {
        // Adapts the injected clock to the interface jwt-cpp's verifier expects.
        struct CodecClock
        {
            Clock source;
            jwt::date now() const { return source(); }
        };
    }

    SigningAlgorithm algorithm_from_string(const std::string &name)
    {
        if (name == "HS256")
            return SigningAlgorithm::HS256;
        if (name == "HS384")
            return SigningAlgorithm::HS384;
        if (name == "HS512")
            return SigningAlgorithm::HS512;
        throw std::invalid_argument("Unsupported signing algorithm: " + name);
    }

    std::string to_string(SigningAlgorithm algorithm)
    {
        switch (algorithm)
        {
        case SigningAlgorithm::HS256:
            return "HS256";
        case SigningAlgorithm::HS384:
            return "HS384";
        case SigningAlgorithm::HS512:
            return "HS512";
        }
        return "unknown";
    }

    std::string to_string(DecodeError err)
    {
        switch (err)
        {
        case DecodeError::None:
            return "None";
        case DecodeError::Malformed:
            return "Malformed";
        case DecodeError::SignatureInvalid:
            return "SignatureInvalid";
        case DecodeError::Expired:
            return "Expired";
        }
        return "unknown";
    }

    TokenCodec::TokenCodec(std::string secret, SigningAlgorithm algorithm, std::string issuer, Clock clock)
        : secret_(std::move(secret)), algorithm_(algorithm), issuer_(std::move(issuer)), clock_(std::move(clock))
    {
        if (secret_.empty())
        {
            throw std::invalid_argument("TokenCodec requires a non-empty signing secret");
        }
        if (!clock_)
        {
            throw std::invalid_argument("TokenCodec requires a clock");
        }
    }

    std::string TokenCodec::encode(const std::string &subject, std::chrono::seconds ttl) const
    {
        // exp is serialized in whole seconds; issuing on a second boundary keeps
        // the token valid for exactly ttl.
        const auto issued_at = std::chrono::time_point_cast<std::chrono::seconds>(clock_());
        const auto expires_at = issued_at + ttl;

        auto builder = jwt::create()
                           .set_type("JWT")
                           .set_issuer(issuer_)
                           .set_subject(subject)
                           .set_issued_at(issued_at)
                           .set_expires_at(expires_at);

        switch (algorithm_)
        {
        case SigningAlgorithm::HS256:
            return builder.sign(jwt::algorithm::hs256{secret_});
        case SigningAlgorithm::HS384:
            return builder.sign(jwt::algorithm::hs384{secret_});
        case SigningAlgorithm::HS512:
            return builder.sign(jwt::algorithm::hs512{secret_});
        }
        throw std::invalid_argument("Unsupported signing algorithm");
    }

    DecodeResult TokenCodec::decode(const std::string &token) const
    {
        DecodeResult result{{}, DecodeError::Malformed, false};

        if (std::count(token.begin(), token.end(), '.') != 2)
        {
            MyLogger::debug("JWT Format Error: Incorrect token structure");
            return result;
        }

        try
        {
            auto decoded = jwt::decode(token);

            // The base64url decoder ignores the spare low bits of the last character,
            // so several encodings map to one signature. Only the canonical one is accepted.
            const auto canonical = jwt::base::trim<jwt::alphabet::base64url>(
                jwt::base::encode<jwt::alphabet::base64url>(decoded.get_signature()));
            if (canonical != decoded.get_signature_base64())
            {
                MyLogger::debug("JWT Verification Failed: non-canonical signature encoding");
                result.err = DecodeError::SignatureInvalid;
                return result;
            }

            const auto now = clock_();
            auto verifier = jwt::verify<CodecClock, jwt::traits::kazuho_picojson>(CodecClock{[now]
                                                                                              { return now; }})
                                .with_issuer(issuer_);
            switch (algorithm_)
            {
            case SigningAlgorithm::HS256:
                verifier.allow_algorithm(jwt::algorithm::hs256{secret_});
                break;
            case SigningAlgorithm::HS384:
                verifier.allow_algorithm(jwt::algorithm::hs384{secret_});
                break;
            case SigningAlgorithm::HS512:
                verifier.allow_algorithm(jwt::algorithm::hs512{secret_});
                break;
            }

            std::error_code ec;
            verifier.verify(decoded, ec);
            if (ec)
            {
                MyLogger::debug("JWT Verification Failed: " + ec.message());
                if (ec.category() == jwt::error::signature_verification_error_category())
                {
                    result.err = DecodeError::SignatureInvalid;
                }
                else if (ec == jwt::error::token_verification_error::token_expired)
                {
                    result.err = DecodeError::Expired;
                }
                return result;
            }

            if (!decoded.has_subject() || !decoded.has_expires_at())
            {
                MyLogger::debug("JWT Format Error: Missing sub or exp claim");
                return result;
            }

            Claims claims{decoded.get_subject(), decoded.get_expires_at()};

            // jwt-cpp still accepts a token at the exact second of exp.
            if (claims.expires_at <= now)
            {
                result.err = DecodeError::Expired;
                return result;
            }

            result.claims = std::move(claims);
            result.err = DecodeError::None;
            result.success = true;
            return result;
        }
        catch (const std::exception &e)
        {
            MyLogger::debug("JWT Decode Failed: " + std::string(e.what()));
            return result;
        }
    }
}

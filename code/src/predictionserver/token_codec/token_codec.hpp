#pragma once
#include <chrono>
#include <functional>
#include <string>

namespace Authentication
{
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    enum class SigningAlgorithm
    {
        HS256,
        HS384,
        HS512
    };

    // Throws std::invalid_argument for anything but "HS256", "HS384" or "HS512".
    SigningAlgorithm algorithm_from_string(const std::string &name);
    std::string to_string(SigningAlgorithm algorithm);

    struct Claims
    {
        std::string subject;
        std::chrono::system_clock::time_point expires_at;
    };

    enum class DecodeError
    {
        None,
        Malformed,
        SignatureInvalid,
        Expired
    };

    std::string to_string(DecodeError err);

    struct DecodeResult
    {
        Claims claims;
        DecodeError err;
        bool success;
    };

    // Stateless JWT encoder/decoder bound to one secret, algorithm and issuer.
    // Safe to share between threads: every member is read-only after construction.
    class TokenCodec
    {
    public:
        TokenCodec(std::string secret, SigningAlgorithm algorithm, std::string issuer,
                   Clock clock = std::chrono::system_clock::now);

        // Signed token for subject, expiring ttl after the current second.
        std::string encode(const std::string &subject, std::chrono::seconds ttl) const;

        DecodeResult decode(const std::string &token) const;

    private:
        std::string secret_;
        SigningAlgorithm algorithm_;
        std::string issuer_;
        Clock clock_;
    };
}

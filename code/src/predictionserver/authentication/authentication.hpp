#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "../token_codec/token_codec.hpp"
#include "../credential_store/credential_store.hpp"

namespace Authentication
{
    enum class AuthError
    {
        None,
        InvalidCredentials,
        MissingToken,
        MalformedHeader,
        InvalidToken,
        TokenExpired,
        UnknownSubject
    };

    std::string to_string(AuthError err);

    // value holds the token after login() and the subject after authorize().
    struct AuthResult
    {
        std::string value;
        AuthError err;
        bool success;
    };

    // Issues tokens on login and checks bearer tokens on protected calls.
    // Holds references only; the codec and store must outlive the gate.
    class AuthGate
    {
    public:
        static constexpr const char *BEARER_PREFIX = "Bearer ";

        AuthGate(const TokenCodec &codec, const CredentialStore &store,
                 std::chrono::seconds token_ttl = std::chrono::minutes(30));

        AuthResult login(const std::string &username, const std::string &password) const;

        // Pass std::nullopt when the request carries no Authorization header.
        AuthResult authorize(const std::optional<std::string> &authorization_header) const;

        std::chrono::seconds token_ttl() const { return token_ttl_; }

    private:
        const TokenCodec &codec_;
        const CredentialStore &store_;
        std::chrono::seconds token_ttl_;
    };
}

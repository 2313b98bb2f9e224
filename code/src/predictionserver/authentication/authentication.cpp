#include "authentication.hpp"
#include "../logger/Mylogger.h"
#include <stdexcept>

namespace Authentication
{
    std::string to_string(AuthError err)
    {
        switch (err)
        {
        case AuthError::None:
            return "None";
        case AuthError::InvalidCredentials:
            return "InvalidCredentials";
        case AuthError::MissingToken:
            return "MissingToken";
        case AuthError::MalformedHeader:
            return "MalformedHeader";
        case AuthError::InvalidToken:
            return "InvalidToken";
        case AuthError::TokenExpired:
            return "TokenExpired";
        case AuthError::UnknownSubject:
            return "UnknownSubject";
        }
        return "unknown";
    }

    AuthGate::AuthGate(const TokenCodec &codec, const CredentialStore &store, std::chrono::seconds token_ttl)
        : codec_(codec), store_(store), token_ttl_(token_ttl)
    {
        if (token_ttl_.count() <= 0)
        {
            throw std::invalid_argument("Token lifetime must be positive");
        }
    }

    AuthResult AuthGate::login(const std::string &username, const std::string &password) const
    {
        if (!store_.verify(username, password))
        {
            MyLogger::warning("Login rejected for user: " + username);
            return {"", AuthError::InvalidCredentials, false};
        }

        MyLogger::info("Generating JWT token for user: " + username);
        return {codec_.encode(username, token_ttl_), AuthError::None, true};
    }

    AuthResult AuthGate::authorize(const std::optional<std::string> &authorization_header) const
    {
        if (!authorization_header)
        {
            return {"", AuthError::MissingToken, false};
        }

        const std::string &header = *authorization_header;
        const std::string prefix = BEARER_PREFIX;
        if (header.rfind(prefix, 0) != 0)
        {
            return {"", AuthError::MalformedHeader, false};
        }

        auto decoded = codec_.decode(header.substr(prefix.size()));
        if (!decoded.success)
        {
            MyLogger::debug("Token rejected: " + to_string(decoded.err));
            if (decoded.err == DecodeError::Expired)
            {
                return {"", AuthError::TokenExpired, false};
            }
            return {"", AuthError::InvalidToken, false};
        }

        // Accounts removed after issuance must not keep access.
        if (!store_.contains(decoded.claims.subject))
        {
            return {"", AuthError::UnknownSubject, false};
        }

        return {decoded.claims.subject, AuthError::None, true};
    }
}

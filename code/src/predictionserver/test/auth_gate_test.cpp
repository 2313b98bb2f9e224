#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "../authentication/authentication.hpp"

using namespace Authentication;
using std::chrono::minutes;
using std::chrono::seconds;
using std::chrono::system_clock;

namespace
{
    const system_clock::time_point T0{seconds(1700000000)};

    const std::vector<Credential> USERS = {{"admin", "admin123"}, {"user", "pass123"}};

    const std::string BASE64URL = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
}

TEST_CASE("CredentialStore lookups", "[credential_store]")
{
    CredentialStore store(USERS);
    REQUIRE(store.size() == 2);
    REQUIRE(store.verify("admin", "admin123"));
    REQUIRE(store.verify("user", "pass123"));
    REQUIRE_FALSE(store.verify("admin", "pass123"));
    REQUIRE_FALSE(store.verify("admin", "admin1234"));
    REQUIRE_FALSE(store.verify("admin", ""));
    REQUIRE_FALSE(store.verify("nobody", "admin123"));
    REQUIRE(store.contains("user"));
    REQUIRE_FALSE(store.contains("Admin"));

    REQUIRE_THROWS_AS(CredentialStore(std::vector<Credential>{{"a", "x"}, {"a", "y"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(CredentialStore(std::vector<Credential>{{"", "x"}}), std::invalid_argument);
}

TEST_CASE("Login issues tokens that authorize as the same user", "[auth_gate]")
{
    system_clock::time_point now = T0;
    TokenCodec codec("secret", SigningAlgorithm::HS256, "iss", [&now]
                     { return now; });
    CredentialStore store(USERS);
    AuthGate gate(codec, store);

    for (const auto &credential : USERS)
    {
        auto login = gate.login(credential.username, credential.password);
        REQUIRE(login.success);
        REQUIRE(login.err == AuthError::None);
        REQUIRE_FALSE(login.value.empty());

        auto auth = gate.authorize("Bearer " + login.value);
        REQUIRE(auth.success);
        REQUIRE(auth.value == credential.username);
    }
}

TEST_CASE("Login with wrong credentials issues nothing", "[auth_gate]")
{
    TokenCodec codec("secret", SigningAlgorithm::HS256, "iss");
    CredentialStore store(USERS);
    AuthGate gate(codec, store);

    for (const auto &pair : std::vector<Credential>{{"admin", "wrongpassword"},
                                                    {"user", "admin123"},
                                                    {"ghost", "admin123"},
                                                    {"", ""}})
    {
        auto login = gate.login(pair.username, pair.password);
        REQUIRE_FALSE(login.success);
        REQUIRE(login.err == AuthError::InvalidCredentials);
        REQUIRE(login.value.empty());
    }
}

TEST_CASE("Authorization header checks", "[auth_gate]")
{
    TokenCodec codec("secret", SigningAlgorithm::HS256, "iss");
    CredentialStore store(USERS);
    AuthGate gate(codec, store);
    auto token = gate.login("admin", "admin123").value;

    REQUIRE(gate.authorize(std::nullopt).err == AuthError::MissingToken);
    REQUIRE(gate.authorize(std::string("")).err == AuthError::MalformedHeader);
    REQUIRE(gate.authorize(token).err == AuthError::MalformedHeader);
    REQUIRE(gate.authorize("bearer " + token).err == AuthError::MalformedHeader);
    REQUIRE(gate.authorize("Bearer" + token).err == AuthError::MalformedHeader);
    REQUIRE(gate.authorize("Basic YWRtaW46YWRtaW4xMjM=").err == AuthError::MalformedHeader);
    REQUIRE(gate.authorize(std::string("Bearer ")).err == AuthError::InvalidToken);
    REQUIRE(gate.authorize(std::string("Bearer garbage")).err == AuthError::InvalidToken);
    REQUIRE(gate.authorize("Bearer  " + token).err == AuthError::InvalidToken);
}

TEST_CASE("Token lifetime boundary", "[auth_gate]")
{
    system_clock::time_point now = T0;
    TokenCodec codec("secret", SigningAlgorithm::HS256, "iss", [&now]
                     { return now; });
    CredentialStore store(USERS);
    AuthGate gate(codec, store, minutes(30));
    REQUIRE(gate.token_ttl() == minutes(30));

    auto header = "Bearer " + gate.login("admin", "admin123").value;

    for (auto offset : {seconds(0), seconds(1), seconds(900), seconds(1799)})
    {
        now = T0 + offset;
        REQUIRE(gate.authorize(header).success);
    }
    for (auto offset : {seconds(1800), seconds(1801), seconds(36000)})
    {
        now = T0 + offset;
        auto auth = gate.authorize(header);
        REQUIRE_FALSE(auth.success);
        REQUIRE(auth.err == AuthError::TokenExpired);
    }
}

TEST_CASE("Any change to the signature segment is rejected", "[auth_gate]")
{
    TokenCodec codec("secret", SigningAlgorithm::HS256, "iss");
    CredentialStore store(USERS);
    AuthGate gate(codec, store);
    auto token = gate.login("admin", "admin123").value;
    auto signature_start = token.rfind('.') + 1;

    for (auto i = signature_start; i < token.size(); ++i)
    {
        for (char replacement : BASE64URL)
        {
            if (replacement == token[i])
                continue;
            std::string forged = token;
            forged[i] = replacement;
            auto auth = gate.authorize("Bearer " + forged);
            REQUIRE_FALSE(auth.success);
            REQUIRE(auth.err == AuthError::InvalidToken);
            REQUIRE(auth.value.empty());
        }
    }
}

TEST_CASE("Spare bits of the last signature character are checked", "[auth_gate]")
{
    TokenCodec codec("secret", SigningAlgorithm::HS256, "iss");
    CredentialStore store(USERS);
    AuthGate gate(codec, store);
    auto token = gate.login("admin", "admin123").value;

    // 32 signature bytes leave two unused bits in the final character.
    std::string forged = token;
    forged.back() = BASE64URL[BASE64URL.find(token.back()) ^ 1];
    REQUIRE(gate.authorize("Bearer " + forged).err == AuthError::InvalidToken);
}

TEST_CASE("Token signed with another secret is invalid", "[auth_gate]")
{
    TokenCodec codec("secret", SigningAlgorithm::HS256, "iss");
    TokenCodec rogue("not-the-secret", SigningAlgorithm::HS256, "iss");
    CredentialStore store(USERS);
    AuthGate gate(codec, store);

    auto auth = gate.authorize("Bearer " + rogue.encode("admin", minutes(5)));
    REQUIRE(auth.err == AuthError::InvalidToken);
}

TEST_CASE("Subject must still be a known account", "[auth_gate]")
{
    TokenCodec codec("secret", SigningAlgorithm::HS256, "iss");
    CredentialStore store(USERS);
    AuthGate gate(codec, store);

    auto auth = gate.authorize("Bearer " + codec.encode("removed-user", minutes(5)));
    REQUIRE_FALSE(auth.success);
    REQUIRE(auth.err == AuthError::UnknownSubject);

    CredentialStore smaller(std::vector<Credential>{{"user", "pass123"}});
    AuthGate stricter(codec, smaller);
    auto admin_token = gate.login("admin", "admin123").value;
    REQUIRE(stricter.authorize("Bearer " + admin_token).err == AuthError::UnknownSubject);
}

TEST_CASE("Gate rejects a non-positive lifetime", "[auth_gate]")
{
    TokenCodec codec("secret", SigningAlgorithm::HS256, "iss");
    CredentialStore store(USERS);
    REQUIRE_THROWS_AS(AuthGate(codec, store, seconds(0)), std::invalid_argument);
}

TEST_CASE("Error names", "[auth_gate]")
{
    REQUIRE(to_string(AuthError::MissingToken) == "MissingToken");
    REQUIRE(to_string(AuthError::TokenExpired) == "TokenExpired");
    REQUIRE(to_string(AuthError::UnknownSubject) == "UnknownSubject");
}

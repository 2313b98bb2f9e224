#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <chrono>
#include <string>

#include "../token_codec/token_codec.hpp"

using namespace Authentication;
using std::chrono::minutes;
using std::chrono::seconds;
using std::chrono::system_clock;

namespace
{
    const system_clock::time_point T0{seconds(1700000000)};
}

TEST_CASE("Algorithm names", "[token_codec]")
{
    REQUIRE(algorithm_from_string("HS256") == SigningAlgorithm::HS256);
    REQUIRE(algorithm_from_string("HS384") == SigningAlgorithm::HS384);
    REQUIRE(algorithm_from_string("HS512") == SigningAlgorithm::HS512);
    REQUIRE(to_string(SigningAlgorithm::HS512) == "HS512");
    REQUIRE_THROWS_AS(algorithm_from_string("RS256"), std::invalid_argument);
    REQUIRE_THROWS_AS(algorithm_from_string("hs256"), std::invalid_argument);
}

TEST_CASE("Codec rejects an empty secret", "[token_codec]")
{
    REQUIRE_THROWS_AS(TokenCodec("", SigningAlgorithm::HS256, "issuer"), std::invalid_argument);
}

TEST_CASE("Encoded token decodes to the same claims", "[token_codec]")
{
    system_clock::time_point now = T0;
    TokenCodec codec("secret", SigningAlgorithm::HS256, "admissions-service", [&now]
                     { return now; });

    auto token = codec.encode("admin", minutes(30));
    REQUIRE(std::count(token.begin(), token.end(), '.') == 2);

    auto decoded = codec.decode(token);
    REQUIRE(decoded.success);
    REQUIRE(decoded.err == DecodeError::None);
    REQUIRE(decoded.claims.subject == "admin");
    REQUIRE(decoded.claims.expires_at == T0 + minutes(30));
}

TEST_CASE("Every HMAC algorithm round-trips", "[token_codec]")
{
    system_clock::time_point now = T0;
    for (auto algorithm : {SigningAlgorithm::HS256, SigningAlgorithm::HS384, SigningAlgorithm::HS512})
    {
        TokenCodec codec("secret", algorithm, "iss", [&now]
                         { return now; });
        auto decoded = codec.decode(codec.encode("user", seconds(60)));
        REQUIRE(decoded.success);
        REQUIRE(decoded.claims.subject == "user");
    }
}

TEST_CASE("Expiry is exact to the second", "[token_codec]")
{
    system_clock::time_point now = T0;
    TokenCodec codec("secret", SigningAlgorithm::HS256, "iss", [&now]
                     { return now; });
    auto token = codec.encode("admin", seconds(1800));

    now = T0 + seconds(1799);
    REQUIRE(codec.decode(token).success);

    now = T0 + seconds(1800);
    auto at_expiry = codec.decode(token);
    REQUIRE_FALSE(at_expiry.success);
    REQUIRE(at_expiry.err == DecodeError::Expired);

    now = T0 + minutes(90);
    REQUIRE(codec.decode(token).err == DecodeError::Expired);
}

TEST_CASE("exp is floored to the issuing second", "[token_codec]")
{
    system_clock::time_point now = T0 + std::chrono::milliseconds(700);
    TokenCodec codec("secret", SigningAlgorithm::HS256, "iss", [&now]
                     { return now; });
    auto token = codec.encode("admin", seconds(10));

    now = T0 + seconds(9) + std::chrono::milliseconds(999);
    REQUIRE(codec.decode(token).success);
    now = T0 + seconds(10);
    REQUIRE(codec.decode(token).err == DecodeError::Expired);
}

TEST_CASE("Signature and structure failures", "[token_codec]")
{
    system_clock::time_point now = T0;
    auto clock = [&now]
    { return now; };
    TokenCodec codec("secret", SigningAlgorithm::HS256, "iss", clock);
    auto token = codec.encode("admin", minutes(5));

    SECTION("Different secret")
    {
        TokenCodec other("another-secret", SigningAlgorithm::HS256, "iss", clock);
        REQUIRE(other.decode(token).err == DecodeError::SignatureInvalid);
    }

    SECTION("Different issuer")
    {
        TokenCodec other("secret", SigningAlgorithm::HS256, "someone-else", clock);
        REQUIRE(other.decode(token).err == DecodeError::Malformed);
    }

    SECTION("Different algorithm")
    {
        TokenCodec other("secret", SigningAlgorithm::HS512, "iss", clock);
        REQUIRE_FALSE(other.decode(token).success);
    }

    SECTION("Garbage")
    {
        REQUIRE(codec.decode("").err == DecodeError::Malformed);
        REQUIRE(codec.decode("not-a-token").err == DecodeError::Malformed);
        REQUIRE(codec.decode("a.b.c").err == DecodeError::Malformed);
        REQUIRE(codec.decode("a.b.c.d").err == DecodeError::Malformed);
    }

    SECTION("Payload swapped from another token")
    {
        auto other = codec.encode("user", minutes(5));
        auto first_dot = token.find('.');
        auto second_dot = token.find('.', first_dot + 1);
        auto other_first = other.find('.');
        auto other_second = other.find('.', other_first + 1);
        std::string forged = token.substr(0, first_dot + 1) +
                             other.substr(other_first + 1, other_second - other_first - 1) +
                             token.substr(second_dot);
        auto decoded = codec.decode(forged);
        REQUIRE_FALSE(decoded.success);
        REQUIRE(decoded.claims.subject.empty());
    }
}

TEST_CASE("Non-canonical signature encodings are rejected", "[token_codec]")
{
    const std::string alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    system_clock::time_point now = T0;
    auto clock = [&now]
    { return now; };

    // HS256 and HS512 signatures end in a character with spare low bits; HS384 has none.
    for (auto algorithm : {SigningAlgorithm::HS256, SigningAlgorithm::HS384, SigningAlgorithm::HS512})
    {
        TokenCodec codec("secret", algorithm, "iss", clock);
        auto token = codec.encode("admin", minutes(5));
        auto last = alphabet.find(token.back());
        for (std::size_t flip : {1, 2, 3})
        {
            std::string forged = token;
            forged.back() = alphabet[last ^ flip];
            auto decoded = codec.decode(forged);
            REQUIRE_FALSE(decoded.success);
            REQUIRE(decoded.err == DecodeError::SignatureInvalid);
            REQUIRE(decoded.claims.subject.empty());
        }
    }
}

/**
 * @file test_authenticator.cpp
 * @brief Bearer credential verification tests
 */

#include "axiom/auth.hpp"
#include "axiom/common.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace std::chrono_literals;
using axiom::auth::Authenticator;
using axiom::auth::Principal;

namespace {

constexpr std::string_view kSecret = "test-secret";

/// Fixed wall clock at 2024-01-01T00:00:00Z
const axiom::WallClock::time_point kNow{std::chrono::seconds{1704067200}};

Authenticator make_authenticator(axiom::WallClock::time_point now = kNow)
{
    return Authenticator(std::string(kSecret), [now] { return now; });
}

std::int64_t epoch(axiom::WallClock::time_point tp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

/// Hand-assembled compact JWS, for claims issue() never produces
std::string sign_token(const nlohmann::json& header,
                       const nlohmann::json& claims,
                       axiom::common::HmacAlgorithm algorithm = axiom::common::HmacAlgorithm::kSha256,
                       std::string_view secret = kSecret)
{
    const std::string input = std::format("{}.{}",
                                          axiom::common::base64url_encode(header.dump()),
                                          axiom::common::base64url_encode(claims.dump()));
    auto mac = axiom::common::hmac_raw(algorithm, secret, input);
    EXPECT_TRUE(mac);
    return std::format("{}.{}", input, axiom::common::base64url_encode(*mac));
}

nlohmann::json valid_claims()
{
    return nlohmann::json{{"user_id", "user-1"}, {"email", "u1@example.com"}, {"exp", epoch(kNow + 1h)}};
}

const nlohmann::json kHs256Header = {{"alg", "HS256"}, {"typ", "JWT"}};

void expect_rejected(const axiom::Result<Principal>& result, std::string_view fragment)
{
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, axiom::errc::kAuthentication);
    EXPECT_NE(result.error().message.find(fragment), std::string::npos) << result.error().message;
}

}  // namespace

TEST(Authenticator, IssuedTokenVerifies)
{
    auto auth = make_authenticator();
    auto token = auth.issue(Principal{.id = "user-1", .email = "u1@example.com", .role = "editor"}, 1h);
    ASSERT_TRUE(token) << token.error().message;

    auto principal = auth.authenticate("Bearer " + *token);
    ASSERT_TRUE(principal) << principal.error().message;
    EXPECT_EQ(principal->id, "user-1");
    EXPECT_EQ(principal->email, "u1@example.com");
    EXPECT_EQ(principal->role, "editor");
}

TEST(Authenticator, AcceptsHmacFamily)
{
    auto auth = make_authenticator();
    for (auto algorithm : {axiom::common::HmacAlgorithm::kSha384, axiom::common::HmacAlgorithm::kSha512}) {
        auto token = auth.issue(Principal{.id = "user-1"}, 1h, algorithm);
        ASSERT_TRUE(token);
        EXPECT_TRUE(auth.verify_token(*token));
    }
}

TEST(Authenticator, MissingOrNonBearerHeader)
{
    auto auth = make_authenticator();
    expect_rejected(auth.authenticate(""), "required");
    expect_rejected(auth.authenticate("Basic dXNlcjpwYXNz"), "format");
}

TEST(Authenticator, ExpiredAtBoundary)
{
    auto auth = make_authenticator();
    auto claims = valid_claims();
    claims["exp"] = epoch(kNow);
    expect_rejected(auth.verify_token(sign_token(kHs256Header, claims)), "expired");
}

TEST(Authenticator, ExpiryIsRequired)
{
    auto auth = make_authenticator();
    auto claims = valid_claims();
    claims.erase("exp");
    expect_rejected(auth.verify_token(sign_token(kHs256Header, claims)), "expiry");
}

TEST(Authenticator, NotBeforeInFuture)
{
    auto auth = make_authenticator();
    auto claims = valid_claims();
    claims["nbf"] = epoch(kNow + 10s);
    expect_rejected(auth.verify_token(sign_token(kHs256Header, claims)), "not valid yet");

    claims["nbf"] = epoch(kNow);
    EXPECT_TRUE(auth.verify_token(sign_token(kHs256Header, claims)));
}

TEST(Authenticator, RejectsNonHmacAlgorithms)
{
    auto auth = make_authenticator();
    expect_rejected(auth.verify_token(sign_token({{"alg", "none"}}, valid_claims())), "unexpected signing method");
    expect_rejected(auth.verify_token(sign_token({{"alg", "RS256"}}, valid_claims())), "unexpected signing method");
}

TEST(Authenticator, RejectsWrongSecret)
{
    auto auth = make_authenticator();
    auto token = sign_token(kHs256Header, valid_claims(), axiom::common::HmacAlgorithm::kSha256, "other-secret");
    expect_rejected(auth.verify_token(token), "signature");
}

TEST(Authenticator, RejectsTamperedPayload)
{
    auto auth = make_authenticator();
    auto token = sign_token(kHs256Header, valid_claims());
    auto forged_claims = valid_claims();
    forged_claims["user_id"] = "admin";

    const auto first = token.find('.');
    const auto second = token.find('.', first + 1);
    const std::string forged = token.substr(0, first + 1)
                               + axiom::common::base64url_encode(forged_claims.dump())
                               + token.substr(second);
    expect_rejected(auth.verify_token(forged), "signature");
}

TEST(Authenticator, RejectsMalformedTokens)
{
    auto auth = make_authenticator();
    expect_rejected(auth.verify_token("not-a-token"), "malformed");
    expect_rejected(auth.verify_token("a.b"), "malformed");
    expect_rejected(auth.verify_token("a.b.c.d"), "malformed");
    expect_rejected(auth.verify_token("!!!.e30.sig"), "malformed");
}

TEST(Authenticator, UserIdIsRequired)
{
    auto auth = make_authenticator();
    auto claims = valid_claims();
    claims.erase("user_id");
    expect_rejected(auth.verify_token(sign_token(kHs256Header, claims)), "user_id");
}

TEST(Authenticator, TokenExpiresWithClock)
{
    auto issuer = make_authenticator();
    auto token = issuer.issue(Principal{.id = "user-1"}, 60s);
    ASSERT_TRUE(token);

    EXPECT_TRUE(make_authenticator(kNow + 59s).verify_token(*token));
    expect_rejected(make_authenticator(kNow + 60s).verify_token(*token), "expired");
}

TEST(Authenticator, EmptySecretRejectsEverything)
{
    Authenticator auth("", [] { return kNow; });
    EXPECT_FALSE(auth.issue(Principal{.id = "user-1"}, 1h));
    expect_rejected(auth.verify_token(sign_token(kHs256Header, valid_claims())), "not configured");
}

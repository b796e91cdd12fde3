#pragma once

/**
 * @file auth.hpp
 * @brief Bearer credential verification (compact JWS, HMAC family)
 *
 * Accepted: HS256, HS384, HS512. Required claims: user_id, exp.
 * Optional claims: email, role, nbf.
 */

#include "axiom/common.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

namespace axiom::auth {

/// Authenticated caller derived from a verified credential; never persisted
struct Principal
{
    std::string id;
    std::string email;
    std::string role;
};

class Authenticator
{
public:
    using NowFn = std::function<WallClock::time_point()>;

    /**
     * @param secret Shared HMAC secret; must not be empty
     * @param now Clock source; defaults to std::chrono::system_clock::now
     */
    explicit Authenticator(std::string secret, NowFn now = {});

    /**
     * Verify an Authorization header value ("Bearer <token>").
     * @return AuthenticationError when missing, malformed, expired,
     *         not yet valid, badly signed or using an unexpected algorithm
     */
    [[nodiscard]] axiom::Result<Principal> authenticate(std::string_view authorization) const;

    /// Verify a bare compact token
    [[nodiscard]] axiom::Result<Principal> verify_token(std::string_view token) const;

    /**
     * Mint a token for principal valid for ttl from now.
     */
    [[nodiscard]] axiom::Result<std::string> issue(
        const Principal& principal,
        std::chrono::seconds ttl,
        common::HmacAlgorithm algorithm = common::HmacAlgorithm::kSha256) const;

private:
    std::string m_secret;
    NowFn m_now;
};

}  // namespace axiom::auth

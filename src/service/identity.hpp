#pragma once

#include "core/caller.hpp"
#include "core/result.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace waypool::config {
struct Settings;
}

namespace waypool::service {

/**
 * AuthRequest - What a front end knows about the caller before resolution.
 */
struct AuthRequest {
    std::optional<std::string> bearer_token;
    std::optional<UserId> asserted_user;
    Role role{Role::Rider};
};

/**
 * IdentityResolver - Turns an AuthRequest into the Caller an operation
 * runs as. The core never looks at the deployment environment; the
 * choice of resolver is made once at startup.
 */
class IdentityResolver {
public:
    virtual ~IdentityResolver() = default;
    [[nodiscard]] virtual Result<Caller, Error> resolve(const AuthRequest& request) const = 0;
};

/**
 * TokenVerifier - Maps a bearer token to the user it was issued to.
 */
class TokenVerifier {
public:
    virtual ~TokenVerifier() = default;
    [[nodiscard]] virtual std::optional<UserId> verify(std::string_view token) const = 0;
};

/**
 * Tokens listed in configuration, token -> user id.
 */
class StaticTokenVerifier final : public TokenVerifier {
public:
    explicit StaticTokenVerifier(std::map<std::string, UserId, std::less<>> tokens)
        : tokens_(std::move(tokens)) {}

    [[nodiscard]] std::optional<UserId> verify(std::string_view token) const override;

private:
    std::map<std::string, UserId, std::less<>> tokens_;
};

/**
 * Requires a bearer token the verifier accepts; ignores any asserted id.
 */
class TrustedIdentityResolver final : public IdentityResolver {
public:
    explicit TrustedIdentityResolver(const TokenVerifier& verifier) : verifier_(verifier) {}

    [[nodiscard]] Result<Caller, Error> resolve(const AuthRequest& request) const override;

private:
    const TokenVerifier& verifier_;
};

/**
 * Accepts the caller-supplied user id without proof. For local and test
 * deployments only; every resolution is logged.
 */
class AssertedIdentityResolver final : public IdentityResolver {
public:
    [[nodiscard]] Result<Caller, Error> resolve(const AuthRequest& request) const override;
};

/**
 * Pick the resolver named by settings. Asserted identities are refused
 * in production.
 */
[[nodiscard]] Result<std::unique_ptr<IdentityResolver>, Error> make_identity_resolver(
    const config::Settings& settings,
    const TokenVerifier& verifier);

} // namespace waypool::service

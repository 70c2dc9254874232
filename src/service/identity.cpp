#include "service/identity.hpp"
#include "config/settings.hpp"
#include "core/logging.hpp"

namespace waypool::service {

std::optional<UserId> StaticTokenVerifier::verify(std::string_view token) const {
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<Caller, Error> TrustedIdentityResolver::resolve(const AuthRequest& request) const {
    if (!request.bearer_token || request.bearer_token->empty()) {
        return Result<Caller, Error>::err(Error{"Authentication required", ErrorCode::Forbidden});
    }
    auto user = verifier_.verify(*request.bearer_token);
    if (!user) {
        qCWarning(waypoolIdentity) << "rejected unknown bearer token";
        return Result<Caller, Error>::err(Error{"Invalid token", ErrorCode::Forbidden});
    }
    return Result<Caller, Error>::ok(Caller{*user, request.role});
}

Result<Caller, Error> AssertedIdentityResolver::resolve(const AuthRequest& request) const {
    if (!request.asserted_user || !request.asserted_user->is_valid()) {
        return Result<Caller, Error>::err(Error{"A user id is required", ErrorCode::Forbidden});
    }
    qCWarning(waypoolIdentity) << "acting as asserted user" << request.asserted_user->value
                               << "without verification";
    return Result<Caller, Error>::ok(Caller{*request.asserted_user, request.role});
}

Result<std::unique_ptr<IdentityResolver>, Error> make_identity_resolver(
    const config::Settings& settings,
    const TokenVerifier& verifier
) {
    using ResolverResult = Result<std::unique_ptr<IdentityResolver>, Error>;

    switch (settings.auth_mode) {
        case config::AuthMode::Trusted:
            return ResolverResult::ok(std::make_unique<TrustedIdentityResolver>(verifier));
        case config::AuthMode::Asserted:
            if (settings.environment == config::Environment::Production) {
                return ResolverResult::err(Error{
                    "Asserted identities are not allowed in production", ErrorCode::InvalidArgument});
            }
            qCWarning(waypoolIdentity) << "asserted identity mode enabled; callers are not verified";
            return ResolverResult::ok(std::make_unique<AssertedIdentityResolver>());
    }
    return ResolverResult::err(Error{"Unknown authentication mode"});
}

} // namespace waypool::service

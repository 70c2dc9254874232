#include <catch2/catch_test_macros.hpp>
#include "service/identity.hpp"
#include "config/settings.hpp"

using namespace waypool;
using namespace waypool::service;

TEST_CASE("Trusted identity needs a known token", "[identity]") {
    StaticTokenVerifier verifier({{"tok-driver", UserId(1)}, {"tok-rider", UserId(2)}});
    TrustedIdentityResolver resolver(verifier);

    SECTION("known token resolves to its user") {
        auto caller = resolver.resolve(AuthRequest{"tok-driver", std::nullopt, Role::Driver}).unwrap();
        REQUIRE(caller == Caller::driver(UserId(1)));
    }

    SECTION("asserted id is ignored") {
        auto caller = resolver.resolve(AuthRequest{"tok-rider", UserId(99), Role::Rider}).unwrap();
        REQUIRE(caller.user_id == UserId(2));
    }

    SECTION("missing or unknown token") {
        REQUIRE(resolver.resolve(AuthRequest{std::nullopt, UserId(1), Role::Driver}).unwrap_err().code ==
                ErrorCode::Forbidden);
        REQUIRE(resolver.resolve(AuthRequest{"", std::nullopt, Role::Driver}).unwrap_err().code ==
                ErrorCode::Forbidden);
        REQUIRE(resolver.resolve(AuthRequest{"tok-nope", std::nullopt, Role::Driver}).unwrap_err().code ==
                ErrorCode::Forbidden);
    }
}

TEST_CASE("Asserted identity takes the caller's word", "[identity]") {
    AssertedIdentityResolver resolver;

    REQUIRE(resolver.resolve(AuthRequest{std::nullopt, UserId(7), Role::Rider}).unwrap() ==
            Caller::rider(UserId(7)));
    REQUIRE(resolver.resolve(AuthRequest{}).unwrap_err().code == ErrorCode::Forbidden);
    REQUIRE(resolver.resolve(AuthRequest{std::nullopt, UserId(0), Role::Rider}).is_err());
}

TEST_CASE("Resolver selection follows settings", "[identity][config]") {
    StaticTokenVerifier verifier(std::map<std::string, UserId, std::less<>>{});
    config::Settings settings;

    SECTION("trusted by default") {
        auto resolver = make_identity_resolver(settings, verifier).unwrap();
        REQUIRE(resolver->resolve(AuthRequest{std::nullopt, UserId(1), Role::Rider}).is_err());
    }

    SECTION("asserted outside production") {
        settings.auth_mode = config::AuthMode::Asserted;
        settings.environment = config::Environment::Test;
        auto resolver = make_identity_resolver(settings, verifier).unwrap();
        REQUIRE(resolver->resolve(AuthRequest{std::nullopt, UserId(1), Role::Rider}).is_ok());
    }

    SECTION("asserted refused in production") {
        settings.auth_mode = config::AuthMode::Asserted;
        settings.environment = config::Environment::Production;
        REQUIRE(make_identity_resolver(settings, verifier).unwrap_err().code ==
                ErrorCode::InvalidArgument);
    }
}

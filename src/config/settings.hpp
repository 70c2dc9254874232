#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "crypto/password_hash.hpp"
#include "pickup/pickup_pin.hpp"

#include <QProcessEnvironment>
#include <QString>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace waypool::config {

enum class Environment {
    Development,
    Test,
    Production
};

enum class AuthMode {
    Trusted,
    Asserted
};

[[nodiscard]] std::string_view to_string(Environment env);
[[nodiscard]] std::string_view to_string(AuthMode mode);
[[nodiscard]] std::optional<Environment> parse_environment(std::string_view name);
[[nodiscard]] std::optional<AuthMode> parse_auth_mode(std::string_view name);

// Only good enough for a laptop; refused in production.
constexpr std::string_view DEVELOPMENT_PIN_SECRET = "waypool-development-pin-secret";

constexpr std::string_view DEFAULT_CONFIG_FILE = "waypool.ini";

/**
 * Settings - Runtime configuration.
 *
 * Read from an INI file, then overridden by environment variables:
 *
 *   [general]  environment        WAYPOOL_ENV
 *   [storage]  database           WAYPOOL_DB_PATH
 *              busy_timeout_ms
 *   [pickup]   secret             WAYPOOL_PIN_SECRET
 *              validity_hours, max_attempts, lockout_minutes, hash_strength
 *   [auth]     mode               WAYPOOL_AUTH_MODE
 *   [logging]  file               WAYPOOL_LOG_FILE
 *   [tokens]   <token> = <user id>
 */
struct Settings {
    Environment environment{Environment::Development};
    std::string database_path{"waypool.db"};
    int busy_timeout_ms{5000};
    std::string pin_secret{DEVELOPMENT_PIN_SECRET};
    pickup::PinPolicy pin_policy{};
    std::string hash_strength{"interactive"};
    AuthMode auth_mode{AuthMode::Trusted};
    std::string log_file;
    std::map<std::string, UserId, std::less<>> tokens;

    [[nodiscard]] bool uses_development_secret() const {
        return pin_secret == DEVELOPMENT_PIN_SECRET;
    }

    /**
     * Argon2 cost for hash_strength. Always valid after load().
     */
    [[nodiscard]] crypto::HashParams hash_params() const;

    /**
     * Load `ini_path` (skipped when empty) and apply overrides from `env`.
     * Malformed or out-of-range values fail with InvalidArgument.
     */
    [[nodiscard]] static Result<Settings, Error> load(const QString& ini_path,
                                                      const QProcessEnvironment& env);
};

} // namespace waypool::config

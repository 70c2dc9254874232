#include "config/settings.hpp"
#include "core/logging.hpp"

#include <QFileInfo>
#include <QSettings>
#include <QStringList>

namespace waypool::config {
namespace {

Error invalid(const QString& message) {
    return Error{message.toStdString(), ErrorCode::InvalidArgument};
}

// Reads integer keys, remembering the first malformed one.
class IniReader {
public:
    explicit IniReader(QSettings& ini) : ini_(ini) {}

    std::string text(const QString& key, const std::string& fallback) {
        if (!ini_.contains(key)) return fallback;
        return ini_.value(key).toString().trimmed().toStdString();
    }

    int integer(const QString& key, int fallback, int min, int max) {
        if (!ini_.contains(key)) return fallback;
        bool ok = false;
        const int value = ini_.value(key).toString().trimmed().toInt(&ok);
        if (!ok || value < min || value > max) {
            fail(QStringLiteral("%1 must be an integer between %2 and %3")
                     .arg(key).arg(min).arg(max));
            return fallback;
        }
        return value;
    }

    void fail(const QString& message) {
        if (!error_) error_ = invalid(message);
    }

    [[nodiscard]] const std::optional<Error>& error() const { return error_; }

private:
    QSettings& ini_;
    std::optional<Error> error_;
};

Result<void, Error> read_ini(const QString& path, Settings& settings) {
    if (!QFileInfo::exists(path)) {
        return Result<void, Error>::err(invalid(QStringLiteral("Configuration file not found: %1").arg(path)));
    }

    QSettings ini(path, QSettings::IniFormat);
    if (ini.status() != QSettings::NoError) {
        return Result<void, Error>::err(invalid(QStringLiteral("Cannot parse configuration file: %1").arg(path)));
    }

    IniReader reader(ini);

    const auto env_name = reader.text(QStringLiteral("general/environment"),
                                      std::string(to_string(settings.environment)));
    if (auto env = parse_environment(env_name)) {
        settings.environment = *env;
    } else {
        reader.fail(QStringLiteral("general/environment must be development, test or production"));
    }

    settings.database_path = reader.text(QStringLiteral("storage/database"), settings.database_path);
    settings.busy_timeout_ms = reader.integer(QStringLiteral("storage/busy_timeout_ms"),
                                              settings.busy_timeout_ms, 0, 600000);

    settings.pin_secret = reader.text(QStringLiteral("pickup/secret"), settings.pin_secret);
    settings.pin_policy.validity = std::chrono::hours(reader.integer(
        QStringLiteral("pickup/validity_hours"),
        static_cast<int>(settings.pin_policy.validity.count()), 1, 24 * 30));
    settings.pin_policy.max_attempts = reader.integer(
        QStringLiteral("pickup/max_attempts"), settings.pin_policy.max_attempts, 1, 100);
    settings.pin_policy.lockout = std::chrono::minutes(reader.integer(
        QStringLiteral("pickup/lockout_minutes"),
        static_cast<int>(settings.pin_policy.lockout.count()), 1, 24 * 60));
    settings.hash_strength = reader.text(QStringLiteral("pickup/hash_strength"), settings.hash_strength);

    const auto mode_name = reader.text(QStringLiteral("auth/mode"),
                                       std::string(to_string(settings.auth_mode)));
    if (auto mode = parse_auth_mode(mode_name)) {
        settings.auth_mode = *mode;
    } else {
        reader.fail(QStringLiteral("auth/mode must be trusted or asserted"));
    }

    settings.log_file = reader.text(QStringLiteral("logging/file"), settings.log_file);

    ini.beginGroup(QStringLiteral("tokens"));
    for (const auto& token : ini.childKeys()) {
        bool ok = false;
        const qint64 user = ini.value(token).toString().trimmed().toLongLong(&ok);
        if (!ok || user <= 0) {
            reader.fail(QStringLiteral("tokens/%1 must map to a positive user id").arg(token));
            continue;
        }
        settings.tokens.insert_or_assign(token.toStdString(), UserId(user));
    }
    ini.endGroup();

    if (reader.error()) {
        return Result<void, Error>::err(*reader.error());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> apply_environment(const QProcessEnvironment& env, Settings& settings) {
    auto value = [&](const char* name) -> std::optional<std::string> {
        const auto key = QString::fromLatin1(name);
        if (!env.contains(key)) return std::nullopt;
        const auto text = env.value(key).trimmed();
        if (text.isEmpty()) return std::nullopt;
        return text.toStdString();
    };

    if (auto name = value("WAYPOOL_ENV")) {
        auto env_value = parse_environment(*name);
        if (!env_value) {
            return Result<void, Error>::err(invalid(
                QStringLiteral("WAYPOOL_ENV must be development, test or production")));
        }
        settings.environment = *env_value;
    }
    if (auto path = value("WAYPOOL_DB_PATH")) {
        settings.database_path = *path;
    }
    if (auto secret = value("WAYPOOL_PIN_SECRET")) {
        settings.pin_secret = *secret;
    }
    if (auto name = value("WAYPOOL_AUTH_MODE")) {
        auto mode = parse_auth_mode(*name);
        if (!mode) {
            return Result<void, Error>::err(invalid(
                QStringLiteral("WAYPOOL_AUTH_MODE must be trusted or asserted")));
        }
        settings.auth_mode = *mode;
    }
    if (auto file = value("WAYPOOL_LOG_FILE")) {
        settings.log_file = *file;
    }
    return Result<void, Error>::ok();
}

Result<void, Error> check(const Settings& settings) {
    if (settings.database_path.empty()) {
        return Result<void, Error>::err(invalid(QStringLiteral("storage/database must not be empty")));
    }
    if (settings.pin_secret.empty()) {
        return Result<void, Error>::err(invalid(QStringLiteral("pickup/secret must not be empty")));
    }
    if (!crypto::HashParams::from_name(settings.hash_strength)) {
        return Result<void, Error>::err(invalid(
            QStringLiteral("pickup/hash_strength must be interactive, moderate, sensitive or minimal")));
    }
    if (settings.environment == Environment::Production) {
        if (settings.uses_development_secret()) {
            return Result<void, Error>::err(invalid(
                QStringLiteral("WAYPOOL_PIN_SECRET must be set in production")));
        }
        if (settings.hash_strength == "minimal") {
            return Result<void, Error>::err(invalid(
                QStringLiteral("pickup/hash_strength minimal is not allowed in production")));
        }
    }
    return Result<void, Error>::ok();
}

} // namespace

std::string_view to_string(Environment env) {
    switch (env) {
        case Environment::Development: return "development";
        case Environment::Test: return "test";
        case Environment::Production: return "production";
    }
    return "unknown";
}

std::string_view to_string(AuthMode mode) {
    switch (mode) {
        case AuthMode::Trusted: return "trusted";
        case AuthMode::Asserted: return "asserted";
    }
    return "unknown";
}

std::optional<Environment> parse_environment(std::string_view name) {
    if (name == "development") return Environment::Development;
    if (name == "test") return Environment::Test;
    if (name == "production") return Environment::Production;
    return std::nullopt;
}

std::optional<AuthMode> parse_auth_mode(std::string_view name) {
    if (name == "trusted") return AuthMode::Trusted;
    if (name == "asserted") return AuthMode::Asserted;
    return std::nullopt;
}

crypto::HashParams Settings::hash_params() const {
    return crypto::HashParams::from_name(hash_strength).value_or(crypto::HashParams::interactive());
}

Result<Settings, Error> Settings::load(const QString& ini_path, const QProcessEnvironment& env) {
    Settings settings;

    if (!ini_path.isEmpty()) {
        auto read = read_ini(ini_path, settings);
        if (read.is_err()) {
            return Result<Settings, Error>::err(read.unwrap_err());
        }
    }

    auto overridden = apply_environment(env, settings);
    if (overridden.is_err()) {
        return Result<Settings, Error>::err(overridden.unwrap_err());
    }

    auto checked = check(settings);
    if (checked.is_err()) {
        return Result<Settings, Error>::err(checked.unwrap_err());
    }

    if (settings.uses_development_secret()) {
        qCWarning(waypoolPickup) << "using the development pickup PIN secret; set WAYPOOL_PIN_SECRET";
    }
    return Result<Settings, Error>::ok(std::move(settings));
}

} // namespace waypool::config

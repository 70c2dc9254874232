#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QProcessEnvironment>
#include <QTextStream>

#include "cli/commands.hpp"
#include "config/settings.hpp"
#include "core/clock.hpp"
#include "core/logging.hpp"
#include "crypto/keys.hpp"
#include "pickup/credential_service.hpp"
#include "service/collaborators.hpp"
#include "service/identity.hpp"
#include "service/snapshots.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"

namespace {

void print_json(QTextStream& out, const QJsonValue& value) {
    const auto doc = value.isArray() ? QJsonDocument(value.toArray()) : QJsonDocument(value.toObject());
    out << QString::fromUtf8(doc.toJson(QJsonDocument::Indented));
}

int fail(const waypool::Error& error) {
    QTextStream err(stderr);
    print_json(err, waypool::service::error_to_json(error));
    return waypool::cli::exit_code_for(error);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("waypool");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Waypool ride booking core"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(
        QStringList{QStringLiteral("config")},
        QStringLiteral("INI configuration file (default: ./waypool.ini when present)."),
        QStringLiteral("file"));
    parser.addOption(configOption);

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets WAYPOOL_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption userOption(
        QStringList{QStringLiteral("user")},
        QStringLiteral("Act as this user id (asserted identity mode only)."),
        QStringLiteral("id"));
    parser.addOption(userOption);

    const QCommandLineOption tokenOption(
        QStringList{QStringLiteral("token")},
        QStringLiteral("Bearer token identifying the caller."),
        QStringLiteral("token"));
    parser.addOption(tokenOption);

    const QCommandLineOption roleOption(
        QStringList{QStringLiteral("role")},
        QStringLiteral("Caller role: driver or rider (default rider)."),
        QStringLiteral("role"),
        QStringLiteral("rider"));
    parser.addOption(roleOption);

    const QCommandLineOption verboseOption(
        QStringList{QStringLiteral("verbose")},
        QStringLiteral("Enable debug logging for all waypool categories."));
    parser.addOption(verboseOption);

    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("One of: %1").arg(waypool::cli::command_names().join(QStringLiteral(", "))));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments."),
                                 QStringLiteral("[args...]"));
    parser.process(app);

    if (parser.isSet(verboseOption)) {
        waypool::enable_verbose_logging();
    }
    if (parser.isSet(dbPathOption)) {
        qputenv("WAYPOOL_DB_PATH", parser.value(dbPathOption).toUtf8());
    }

    auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(waypool::cli::InternalFailure);
    }
    const auto command = positional.takeFirst();

    QString configPath = parser.value(configOption);
    if (configPath.isEmpty() && QFileInfo::exists(QString::fromLatin1(waypool::config::DEFAULT_CONFIG_FILE.data()))) {
        configPath = QString::fromLatin1(waypool::config::DEFAULT_CONFIG_FILE.data());
    }

    auto settings_result = waypool::config::Settings::load(configPath, QProcessEnvironment::systemEnvironment());
    if (settings_result.is_err()) {
        return fail(settings_result.unwrap_err());
    }
    const auto settings = std::move(settings_result).unwrap();

    waypool::install_file_logging(QString::fromStdString(settings.log_file));
    qCDebug(waypoolStorage) << "environment" << waypool::config::to_string(settings.environment).data()
                            << "database" << settings.database_path.c_str();

    auto crypto_result = waypool::crypto::init();
    if (crypto_result.is_err()) {
        qCritical() << "Failed to initialize crypto:" << crypto_result.unwrap_err().message.c_str();
        return waypool::cli::InternalFailure;
    }

    auto db_result = waypool::storage::Database::open(settings.database_path, settings.busy_timeout_ms);
    if (db_result.is_err()) {
        qCCritical(waypoolStorage) << db_result.unwrap_err().message.c_str();
        return fail(db_result.unwrap_err());
    }
    auto db = std::move(db_result).unwrap();

    if (command == QStringLiteral("migrate")) {
        auto migrated = waypool::cli::run_migrate(db, positional);
        if (migrated.is_err()) {
            return fail(migrated.unwrap_err());
        }
        QTextStream stdout_stream(stdout);
        print_json(stdout_stream, migrated.unwrap());
        return waypool::cli::Success;
    }

    auto migrated = waypool::storage::initialize_database(db);
    if (migrated.is_err()) {
        qCCritical(waypoolStorage) << migrated.unwrap_err().message.c_str();
        return fail(migrated.unwrap_err());
    }

    auto credentials = waypool::pickup::CredentialService::create(
        settings.pin_secret, settings.hash_params(), settings.pin_policy);
    if (credentials.is_err()) {
        return fail(credentials.unwrap_err());
    }

    // Resolve who is calling.
    waypool::service::StaticTokenVerifier verifier(settings.tokens);
    auto resolver = waypool::service::make_identity_resolver(settings, verifier);
    if (resolver.is_err()) {
        return fail(resolver.unwrap_err());
    }

    const auto role = waypool::parse_role(parser.value(roleOption).toStdString());
    if (!role) {
        return fail(waypool::Error{"--role must be driver or rider", waypool::ErrorCode::InvalidArgument});
    }

    waypool::service::AuthRequest auth{.role = *role};
    if (parser.isSet(tokenOption)) {
        auth.bearer_token = parser.value(tokenOption).toStdString();
    }
    if (parser.isSet(userOption)) {
        bool ok = false;
        const qint64 user = parser.value(userOption).toLongLong(&ok);
        if (!ok) {
            return fail(waypool::Error{"--user must be an integer id", waypool::ErrorCode::InvalidArgument});
        }
        auth.asserted_user = waypool::UserId(user);
    }

    auto caller = resolver.unwrap()->resolve(auth);
    if (caller.is_err()) {
        return fail(caller.unwrap_err());
    }

    waypool::SystemClock clock;
    waypool::service::LoggingNotifier notifier;
    waypool::service::RideService rides(db, clock, &notifier);
    waypool::service::BookingService bookings(db, clock, credentials.unwrap(), nullptr, &notifier);
    waypool::service::PickupVerifier pickups(db, clock, credentials.unwrap(), &notifier);
    waypool::cli::Services services{rides, bookings, pickups};

    auto response = waypool::cli::run_command(command, positional, caller.unwrap(), services);
    if (response.is_err()) {
        return fail(response.unwrap_err());
    }

    QTextStream out(stdout);
    print_json(out, response.unwrap());
    return waypool::cli::Success;
}

#pragma once

#include "core/caller.hpp"
#include "core/result.hpp"
#include "service/booking_service.hpp"
#include "service/pickup_verification.hpp"
#include "service/ride_service.hpp"
#include "storage/database.hpp"

#include <QJsonValue>
#include <QString>
#include <QStringList>

namespace waypool::cli {

struct Services {
    service::RideService& rides;
    service::BookingService& bookings;
    service::PickupVerifier& pickups;
};

/**
 * Names of the commands run_command understands, for --help.
 */
[[nodiscard]] QStringList command_names();

/**
 * Run one request as `caller` and return its JSON response.
 * `args` are the positional arguments after the command name.
 */
[[nodiscard]] Result<QJsonValue, Error> run_command(const QString& command,
                                                    const QStringList& args,
                                                    const Caller& caller,
                                                    Services& services);

/**
 * `migrate [version]`: move the schema to `version` (default latest),
 * rolling back when it is below the applied one.
 */
[[nodiscard]] Result<QJsonValue, Error> run_migrate(storage::Database& db, const QStringList& args);

// Usage and malformed-input errors share the internal failure code.
enum ExitCode {
    Success = 0,
    InternalFailure = 1,
    BusinessFailure = 2
};

[[nodiscard]] ExitCode exit_code_for(const Error& error);

} // namespace waypool::cli

#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(waypoolBooking)
Q_DECLARE_LOGGING_CATEGORY(waypoolLedger)
Q_DECLARE_LOGGING_CATEGORY(waypoolPickup)
Q_DECLARE_LOGGING_CATEGORY(waypoolRide)
Q_DECLARE_LOGGING_CATEGORY(waypoolStorage)
Q_DECLARE_LOGGING_CATEGORY(waypoolIdentity)
Q_DECLARE_LOGGING_CATEGORY(waypoolNotify)

namespace waypool {

// Installs a Qt message handler that stamps time/level/category on every
// line and appends it to `path`. An empty path logs to stderr only.
void install_file_logging(const QString& path);

// Turns on debug output for every waypool.* category.
void enable_verbose_logging();

} // namespace waypool

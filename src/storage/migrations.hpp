#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace waypool::storage {

/**
 * Migration - A database schema migration.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;  // Optional - for rollback
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "rides_and_bookings",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS rides (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                driver_id INTEGER NOT NULL,
                origin_address TEXT NOT NULL,
                origin_city TEXT NOT NULL,
                origin_state TEXT NOT NULL,
                origin_zip_code TEXT NOT NULL,
                origin_latitude REAL NOT NULL,
                origin_longitude REAL NOT NULL,
                destination_address TEXT NOT NULL,
                destination_city TEXT NOT NULL,
                destination_state TEXT NOT NULL,
                destination_zip_code TEXT NOT NULL,
                destination_latitude REAL NOT NULL,
                destination_longitude REAL NOT NULL,
                departure_at INTEGER NOT NULL,
                total_seats INTEGER NOT NULL CHECK (total_seats BETWEEN 1 AND 8),
                available_seats INTEGER NOT NULL,
                price_per_seat_cents INTEGER NOT NULL CHECK (price_per_seat_cents >= 0),
                status TEXT NOT NULL DEFAULT 'scheduled'
                    CHECK (status IN ('scheduled', 'in-progress', 'completed', 'cancelled')),
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL,
                CHECK (available_seats >= 0 AND available_seats <= total_seats)
            );
            CREATE INDEX IF NOT EXISTS idx_rides_driver ON rides(driver_id);

            CREATE TABLE IF NOT EXISTS bookings (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                ride_id INTEGER NOT NULL REFERENCES rides(id) ON DELETE CASCADE,
                rider_id INTEGER NOT NULL,
                confirmation_number TEXT NOT NULL UNIQUE,
                pickup_address TEXT NOT NULL,
                pickup_city TEXT NOT NULL,
                pickup_state TEXT NOT NULL,
                pickup_zip_code TEXT NOT NULL,
                pickup_latitude REAL NOT NULL,
                pickup_longitude REAL NOT NULL,
                number_of_seats INTEGER NOT NULL CHECK (number_of_seats >= 1),
                price_per_seat_cents INTEGER NOT NULL CHECK (price_per_seat_cents >= 0),
                status TEXT NOT NULL DEFAULT 'pending'
                    CHECK (status IN ('pending', 'confirmed', 'rejected', 'cancelled', 'completed')),
                payment_authorization TEXT,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_bookings_ride ON bookings(ride_id);
            CREATE INDEX IF NOT EXISTS idx_bookings_rider ON bookings(rider_id);

            -- At most one open request per rider and ride
            CREATE UNIQUE INDEX IF NOT EXISTS idx_bookings_open_rider
                ON bookings(ride_id, rider_id)
                WHERE status IN ('pending', 'confirmed');
        )SQL",
        .down_sql = R"SQL(
            DROP INDEX IF EXISTS idx_bookings_open_rider;
            DROP INDEX IF EXISTS idx_bookings_rider;
            DROP INDEX IF EXISTS idx_bookings_ride;
            DROP TABLE IF EXISTS bookings;
            DROP INDEX IF EXISTS idx_rides_driver;
            DROP TABLE IF EXISTS rides;
        )SQL"
    },
    {
        .version = 2,
        .name = "pickup_pin",
        .up_sql = R"SQL(
            ALTER TABLE bookings ADD COLUMN pickup_status TEXT NOT NULL DEFAULT 'pending'
                CHECK (pickup_status IN ('pending', 'picked_up'));
            ALTER TABLE bookings ADD COLUMN pickup_pin_hash TEXT;
            ALTER TABLE bookings ADD COLUMN pickup_pin_encrypted TEXT;
            ALTER TABLE bookings ADD COLUMN pickup_pin_expires_at INTEGER;
            ALTER TABLE bookings ADD COLUMN pickup_pin_attempts INTEGER NOT NULL DEFAULT 0;
            ALTER TABLE bookings ADD COLUMN pickup_pin_locked_until INTEGER;
            ALTER TABLE bookings ADD COLUMN picked_up_at INTEGER;
        )SQL",
        .down_sql = R"SQL(
            ALTER TABLE bookings DROP COLUMN picked_up_at;
            ALTER TABLE bookings DROP COLUMN pickup_pin_locked_until;
            ALTER TABLE bookings DROP COLUMN pickup_pin_attempts;
            ALTER TABLE bookings DROP COLUMN pickup_pin_expires_at;
            ALTER TABLE bookings DROP COLUMN pickup_pin_encrypted;
            ALTER TABLE bookings DROP COLUMN pickup_pin_hash;
            ALTER TABLE bookings DROP COLUMN pickup_status;
        )SQL"
    },
};

/**
 * MigrationRunner - Applies and rolls back schema migrations, recording
 * the applied versions in schema_migrations.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Run all pending migrations.
     */
    [[nodiscard]] Result<void, Error> migrate();

    /**
     * Migrate to a specific version.
     */
    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    /**
     * Rollback to a specific version.
     */
    [[nodiscard]] Result<void, Error> rollback_to(int target_version);

    /**
     * Move the schema up or down to `target_version` and return the version
     * now applied. Versions outside [0, latest] are InvalidArgument.
     */
    [[nodiscard]] Result<int, Error> apply(int target_version);

    /**
     * Get the current schema version.
     */
    [[nodiscard]] Result<int, Error> current_version();

    /**
     * Get the latest available migration version.
     */
    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> run_rollback(const Migration& m);
    [[nodiscard]] Result<void, Error> record_version(const Migration& m);
};

/**
 * Initialize a database with all migrations.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace waypool::storage

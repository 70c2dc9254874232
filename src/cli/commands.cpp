#include "cli/commands.hpp"
#include "cli/requests.hpp"
#include "service/snapshots.hpp"
#include "storage/migrations.hpp"

#include <QJsonArray>
#include <QJsonObject>

#include <functional>
#include <map>

namespace waypool::cli {
namespace {

using Response = Result<QJsonValue, Error>;
using Handler = std::function<Response(const QStringList&, const Caller&, Services&)>;

Error usage(const QString& text) {
    return Error{("usage: waypool " + text).toStdString(), ErrorCode::InvalidArgument};
}

Response ride_response(Result<Ride, Error> result) {
    return std::move(result).map([](const Ride& ride) -> QJsonValue {
        return service::ride_to_json(ride);
    });
}

Response booking_response(Result<Booking, Error> result) {
    return std::move(result).map([](const Booking& booking) -> QJsonValue {
        return service::booking_to_json(booking);
    });
}

// Commands of the form "<name> <id>".
template<typename IdType, typename F>
Handler with_id(const char* name, const char* what, F&& call) {
    return [name, what, call = std::forward<F>(call)](const QStringList& args,
                                                      const Caller& caller,
                                                      Services& services) -> Response {
        if (args.size() != 1) {
            return Response::err(usage(QStringLiteral("%1 <%2>").arg(QLatin1String(name), QLatin1String(what))));
        }
        auto id = parse_id(args.at(0), what);
        if (id.is_err()) return Response::err(id.unwrap_err());
        return call(services, caller, IdType(id.unwrap()));
    };
}

const std::map<QString, Handler>& handlers() {
    static const std::map<QString, Handler> table = {
        {QStringLiteral("publish"), [](const QStringList& args, const Caller& caller, Services& s) -> Response {
            if (args.size() != 1) return Response::err(usage(QStringLiteral("publish <ride json>")));
            return ride_response(parse_object(args.at(0))
                .and_then(parse_ride_listing)
                .and_then([&](const service::RideListing& listing) { return s.rides.publish(caller, listing); }));
        }},
        {QStringLiteral("ride"), with_id<RideId>("ride", "rideId",
            [](Services& s, const Caller&, RideId id) { return ride_response(s.rides.get(id)); })},
        {QStringLiteral("rides"), [](const QStringList& args, const Caller& caller, Services& s) -> Response {
            if (!args.isEmpty()) return Response::err(usage(QStringLiteral("rides")));
            auto rides = s.rides.list_for_driver(caller);
            if (rides.is_err()) return Response::err(rides.unwrap_err());
            QJsonArray out;
            for (const auto& ride : rides.unwrap()) out.append(service::ride_to_json(ride));
            return Response::ok(out);
        }},
        {QStringLiteral("start-ride"), with_id<RideId>("start-ride", "rideId",
            [](Services& s, const Caller& c, RideId id) { return ride_response(s.rides.start(c, id)); })},
        {QStringLiteral("complete-ride"), with_id<RideId>("complete-ride", "rideId",
            [](Services& s, const Caller& c, RideId id) { return ride_response(s.rides.complete(c, id)); })},
        {QStringLiteral("cancel-ride"), with_id<RideId>("cancel-ride", "rideId",
            [](Services& s, const Caller& c, RideId id) { return ride_response(s.rides.cancel(c, id)); })},
        {QStringLiteral("book"), [](const QStringList& args, const Caller& caller, Services& s) -> Response {
            if (args.size() != 1) return Response::err(usage(QStringLiteral("book <booking json>")));
            return booking_response(parse_object(args.at(0))
                .and_then(parse_booking_request)
                .and_then([&](const service::BookingRequest& request) { return s.bookings.create(caller, request); }));
        }},
        {QStringLiteral("booking"), with_id<BookingId>("booking", "bookingId",
            [](Services& s, const Caller& c, BookingId id) { return booking_response(s.bookings.get(c, id)); })},
        {QStringLiteral("bookings"), with_id<RideId>("bookings", "rideId",
            [](Services& s, const Caller& c, RideId id) -> Response {
                auto bookings = s.bookings.list_for_ride(c, id);
                if (bookings.is_err()) return Response::err(bookings.unwrap_err());
                QJsonArray out;
                for (const auto& booking : bookings.unwrap()) out.append(service::booking_to_json(booking));
                return Response::ok(out);
            })},
        {QStringLiteral("accept"), with_id<BookingId>("accept", "bookingId",
            [](Services& s, const Caller& c, BookingId id) { return booking_response(s.bookings.accept(c, id)); })},
        {QStringLiteral("reject"), with_id<BookingId>("reject", "bookingId",
            [](Services& s, const Caller& c, BookingId id) { return booking_response(s.bookings.reject(c, id)); })},
        {QStringLiteral("cancel"), with_id<BookingId>("cancel", "bookingId",
            [](Services& s, const Caller& c, BookingId id) { return booking_response(s.bookings.cancel(c, id)); })},
        {QStringLiteral("edit"), [](const QStringList& args, const Caller& caller, Services& s) -> Response {
            if (args.size() != 2) return Response::err(usage(QStringLiteral("edit <bookingId> <changes json>")));
            auto id = parse_id(args.at(0), "bookingId");
            if (id.is_err()) return Response::err(id.unwrap_err());
            return booking_response(parse_object(args.at(1))
                .and_then(parse_booking_edit)
                .and_then([&](const service::BookingEdit& changes) {
                    return s.bookings.edit(caller, BookingId(id.unwrap()), changes);
                }));
        }},
        {QStringLiteral("pin"), with_id<BookingId>("pin", "bookingId",
            [](Services& s, const Caller& c, BookingId id) -> Response {
                auto revealed = s.bookings.reveal_pin(c, id);
                if (revealed.is_err()) return Response::err(revealed.unwrap_err());
                const auto& pin = revealed.unwrap();
                QJsonObject out;
                out.insert(QStringLiteral("bookingId"), static_cast<qint64>(id.value));
                out.insert(QStringLiteral("pickupPin"), QString::fromStdString(pin.pin));
                out.insert(QStringLiteral("expiresAt"), QString::fromStdString(pin.expires_at.to_iso_string()));
                out.insert(QStringLiteral("pickupStatus"),
                           QString::fromUtf8(to_string(pin.pickup_status).data()));
                return Response::ok(out);
            })},
        {QStringLiteral("verify-pickup"), [](const QStringList& args, const Caller& caller, Services& s) -> Response {
            if (args.size() != 2) return Response::err(usage(QStringLiteral("verify-pickup <bookingId> <pin>")));
            auto id = parse_id(args.at(0), "bookingId");
            if (id.is_err()) return Response::err(id.unwrap_err());
            const auto pin = args.at(1).toStdString();
            return booking_response(s.pickups.verify(caller, BookingId(id.unwrap()), pin));
        }},
    };
    return table;
}

} // namespace

QStringList command_names() {
    QStringList names{QStringLiteral("migrate")};
    for (const auto& [name, handler] : handlers()) {
        names << name;
    }
    return names;
}

Result<QJsonValue, Error> run_command(const QString& command,
                                      const QStringList& args,
                                      const Caller& caller,
                                      Services& services) {
    const auto& table = handlers();
    auto it = table.find(command);
    if (it == table.end()) {
        return Response::err(Error{("Unknown command: " + command).toStdString(),
                                   ErrorCode::InvalidArgument});
    }
    return it->second(args, caller, services);
}

Result<QJsonValue, Error> run_migrate(storage::Database& db, const QStringList& args) {
    if (args.size() > 1) {
        return Response::err(usage(QStringLiteral("migrate [version]")));
    }
    int target = storage::MigrationRunner::latest_version();
    if (args.size() == 1) {
        bool ok = false;
        target = args.at(0).trimmed().toInt(&ok);
        if (!ok) {
            return Response::err(usage(QStringLiteral("migrate [version]")));
        }
    }

    storage::MigrationRunner runner(db);
    return runner.apply(target).map([](int version) -> QJsonValue {
        QJsonObject out;
        out.insert(QStringLiteral("schemaVersion"), version);
        return out;
    });
}

ExitCode exit_code_for(const Error& error) {
    switch (error.code) {
        case ErrorCode::Internal:
        case ErrorCode::InvalidArgument:
            return InternalFailure;
        default:
            return BusinessFailure;
    }
}

} // namespace waypool::cli

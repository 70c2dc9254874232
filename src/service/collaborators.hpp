#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include <QJsonObject>
#include <cstdint>
#include <string>
#include <string_view>

namespace waypool::service {

/**
 * PaymentAuthorizer - Places a hold for a booking's price. Capture and
 * refund happen elsewhere.
 */
class PaymentAuthorizer {
public:
    virtual ~PaymentAuthorizer() = default;

    /**
     * Returns the processor's authorization reference.
     */
    [[nodiscard]] virtual Result<std::string, Error> authorize(
        int64_t amount_cents,
        const std::string& payer_reference) = 0;
};

/**
 * Notifier - Best-effort delivery of lifecycle events to a user.
 */
class Notifier {
public:
    virtual ~Notifier() = default;

    [[nodiscard]] virtual Result<void, Error> notify(
        UserId recipient,
        std::string_view event,
        const QJsonObject& payload) = 0;
};

/**
 * Writes every event to the waypool.notify log category.
 */
class LoggingNotifier final : public Notifier {
public:
    [[nodiscard]] Result<void, Error> notify(
        UserId recipient,
        std::string_view event,
        const QJsonObject& payload) override;
};

/**
 * Send through `notifier` (may be null) and log any failure, thrown or
 * returned. Never fails.
 */
void notify_best_effort(Notifier* notifier,
                        UserId recipient,
                        std::string_view event,
                        const QJsonObject& payload);

} // namespace waypool::service

#include "service/collaborators.hpp"
#include "core/logging.hpp"

#include <QJsonDocument>

#include <exception>

namespace waypool::service {

Result<void, Error> LoggingNotifier::notify(
    UserId recipient,
    std::string_view event,
    const QJsonObject& payload
) {
    qCInfo(waypoolNotify).noquote()
        << QString::fromUtf8(event.data(), static_cast<qsizetype>(event.size()))
        << "to user" << recipient.value
        << QString::fromUtf8(QJsonDocument(payload).toJson(QJsonDocument::Compact));
    return Result<void, Error>::ok();
}

void notify_best_effort(Notifier* notifier,
                        UserId recipient,
                        std::string_view event,
                        const QJsonObject& payload) {
    if (!notifier) {
        return;
    }

    const auto event_name = QString::fromUtf8(event.data(), static_cast<qsizetype>(event.size()));
    try {
        auto result = notifier->notify(recipient, event, payload);
        if (result.is_err()) {
            qCWarning(waypoolNotify) << "dropping" << event_name << "for user" << recipient.value
                                     << ":" << result.unwrap_err().message.c_str();
        }
    } catch (const std::exception& e) {
        qCWarning(waypoolNotify) << "notifier threw on" << event_name << "for user"
                                 << recipient.value << ":" << e.what();
    }
}

} // namespace waypool::service

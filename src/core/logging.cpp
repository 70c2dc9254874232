#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>

#include <cstdio>

Q_LOGGING_CATEGORY(waypoolBooking, "waypool.booking", QtInfoMsg)
Q_LOGGING_CATEGORY(waypoolLedger, "waypool.ledger", QtInfoMsg)
Q_LOGGING_CATEGORY(waypoolPickup, "waypool.pickup", QtInfoMsg)
Q_LOGGING_CATEGORY(waypoolRide, "waypool.ride", QtInfoMsg)
Q_LOGGING_CATEGORY(waypoolStorage, "waypool.storage", QtInfoMsg)
Q_LOGGING_CATEGORY(waypoolIdentity, "waypool.identity", QtInfoMsg)
Q_LOGGING_CATEGORY(waypoolNotify, "waypool.notify", QtInfoMsg)

namespace waypool {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
    QString path;
    bool initialized = false;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void ensure_open(LoggerState& s) {
    if (s.initialized) return;
    s.initialized = true;

    if (s.path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(s.path).absolutePath());
    dir.mkpath(QStringLiteral("."));

    s.file.setFileName(s.path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "waypool: cannot open log file %s\n", qPrintable(s.path));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    ensure_open(s);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);

    if (s.file.isOpen()) {
        s.file.write(line.toUtf8());
        s.file.flush();
    } else {
        std::fputs(line.toLocal8Bit().constData(), stderr);
    }
}

} // namespace

void install_file_logging(const QString& path) {
    {
        auto& s = state();
        QMutexLocker lock(&s.mu);
        s.path = path;
        s.initialized = false;
        if (s.file.isOpen()) {
            s.file.close();
        }
    }
    qInstallMessageHandler(message_handler);
}

void enable_verbose_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("waypool.*.debug=true\n"));
}

} // namespace waypool

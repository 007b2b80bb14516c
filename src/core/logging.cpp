#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(rsMdnsLog, "relayscout.mdns", QtInfoMsg)
Q_LOGGING_CATEGORY(rsCoiotLog, "relayscout.coiot", QtInfoMsg)
Q_LOGGING_CATEGORY(rsBleLog, "relayscout.ble", QtInfoMsg)
Q_LOGGING_CATEGORY(rsWifiLog, "relayscout.wifi", QtInfoMsg)
Q_LOGGING_CATEGORY(rsScannerLog, "relayscout.scanner", QtInfoMsg)
Q_LOGGING_CATEGORY(rsUdpLog, "relayscout.udp", QtInfoMsg)
Q_LOGGING_CATEGORY(rsProbeLog, "relayscout.probe", QtInfoMsg)

namespace relayscout {
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
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QString{};
    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);
    const auto utf8 = line.toUtf8();

    auto& s = state();
    QMutexLocker lock(&s.mu);
    if (s.file.isOpen()) {
        s.file.write(utf8);
        s.file.flush();
    }
    std::fputs(utf8.constData(), stderr);
}

} // namespace

void install_file_logging(const QString& path) {
    auto& s = state();
    {
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            s.file.close();
        }
        if (!path.isEmpty()) {
            QDir(QFileInfo(path).absolutePath()).mkpath(QStringLiteral("."));
            s.file.setFileName(path);
            if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                std::fprintf(stderr, "relayscout: cannot open log file %s\n",
                             qPrintable(path));
            }
        }
    }
    qInstallMessageHandler(message_handler);
}

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("relayscout.*.debug=true"));
}

} // namespace relayscout

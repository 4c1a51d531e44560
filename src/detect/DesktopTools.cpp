#include "detect/DesktopTools.h"

#include "core/ExecutableLookup.h"
#include "core/Log.h"
#include "core/ToolRunner.h"
#include "detect/EnvironmentProbe.h"

#include <QDBusConnection>
#include <QDBusError>
#include <QDBusMessage>
#include <QDBusVariant>
#include <QRegularExpression>
#include <QVariant>

namespace {

bool isWindowId(const QString &s) {
    static const QRegularExpression re(QStringLiteral("^(0x[0-9a-fA-F]+|[0-9]+)$"));
    return re.match(s).hasMatch();
}

}

QString SystemDesktopTools::runWindowQuery(const QStringList &args, int timeoutMs) {
    const QString bin = findTrustedTool(QString::fromLatin1(EnvironmentProbe::kWindowQueryTool));
    if (bin.isEmpty() || timeoutMs <= 0) return QString();
    QString out;
    const int rc = runCapture(bin, args, timeoutMs, &out);
    if (rc != 0) return QString();
    return out.trimmed();
}

QStringList SystemDesktopTools::windowsByClass(const QString &windowClass, int timeoutMs) {
    const QString out = runWindowQuery({QStringLiteral("search"), QStringLiteral("--class"), windowClass}, timeoutMs);
    QStringList ids;
    for (const QString &line : out.split('\n', Qt::SkipEmptyParts)) {
        const QString id = line.trimmed();
        if (isWindowId(id)) ids << id;
    }
    return ids;
}

QString SystemDesktopTools::focusedWindow(int timeoutMs) {
    const QString id = runWindowQuery({QStringLiteral("getwindowfocus")}, timeoutMs);
    return isWindowId(id) ? id : QString();
}

QString SystemDesktopTools::activeWindow(int timeoutMs) {
    const QString id = runWindowQuery({QStringLiteral("getactivewindow")}, timeoutMs);
    return isWindowId(id) ? id : QString();
}

QString SystemDesktopTools::windowTitle(const QString &windowId, int timeoutMs) {
    if (!isWindowId(windowId)) return QString();
    return runWindowQuery({QStringLiteral("getwindowname"), windowId}, timeoutMs);
}

QString SystemDesktopTools::windowProperties(const QString &windowId, const QStringList &properties, int timeoutMs) {
    if (!isWindowId(windowId) || timeoutMs <= 0) return QString();
    const QString bin = findTrustedTool(QString::fromLatin1(EnvironmentProbe::kWindowPropertyTool));
    if (bin.isEmpty()) return QString();
    QStringList args = {QStringLiteral("-id"), windowId};
    args << properties;
    QString out;
    if (runCapture(bin, args, timeoutMs, &out) != 0) return QString();
    return out;
}

QString SystemDesktopTools::busProperty(const QString &service, const QString &objectPath,
                                        const QString &interface, const QString &property, int timeoutMs) {
    if (timeoutMs <= 0) return QString();
    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        debugLog(QStringLiteral("dbus_unavailable: ") + bus.lastError().message());
        return QString();
    }
    QDBusMessage msg = QDBusMessage::createMethodCall(service, objectPath,
                                                      QStringLiteral("org.freedesktop.DBus.Properties"),
                                                      QStringLiteral("Get"));
    msg << interface << property;
    const QDBusMessage reply = bus.call(msg, QDBus::Block, timeoutMs);
    if (reply.type() != QDBusMessage::ReplyMessage || reply.arguments().isEmpty()) {
        debugLog(QStringLiteral("dbus_error: %1 %2").arg(reply.errorName(), reply.errorMessage()));
        return QString();
    }
    QVariant value = reply.arguments().constFirst();
    if (value.canConvert<QDBusVariant>()) {
        value = qvariant_cast<QDBusVariant>(value).variant();
    }
    return value.toString();
}

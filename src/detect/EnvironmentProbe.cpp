#include "detect/EnvironmentProbe.h"

#include "core/ExecutableLookup.h"
#include "core/Log.h"

#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QStringList>

namespace {

QMutex gSnapshotMutex;
EnvironmentSnapshot gSnapshot;
bool gSnapshotReady = false;

bool sessionBusPresent() {
    if (!qEnvironmentVariableIsEmpty("DBUS_SESSION_BUS_ADDRESS")) return true;
    const QString runtime = qEnvironmentVariable("XDG_RUNTIME_DIR");
    return !runtime.isEmpty() && QFileInfo::exists(runtime + "/bus");
}

bool hasTrustedTool(const char *name) {
    return !findTrustedTool(QString::fromLatin1(name)).isEmpty();
}

QString yesNo(bool v) { return v ? QStringLiteral("yes") : QStringLiteral("no"); }

}

QString toString(DisplayServer server) {
    return server == DisplayServer::Wayland ? QStringLiteral("wayland") : QStringLiteral("x11");
}

namespace EnvironmentProbe {

EnvironmentSnapshot probe() {
    EnvironmentSnapshot env;
    env.desktop = qEnvironmentVariable("XDG_CURRENT_DESKTOP").toLower();
    if (!qEnvironmentVariableIsEmpty("WAYLAND_DISPLAY")
        || qEnvironmentVariable("XDG_SESSION_TYPE") == QLatin1String("wayland")) {
        env.displayServer = DisplayServer::Wayland;
    }
    env.hasWindowQueryTool = hasTrustedTool(kWindowQueryTool);
    env.hasWindowControlTool = hasTrustedTool(kWindowControlTool);
    env.hasWindowPropertyTool = hasTrustedTool(kWindowPropertyTool);
    env.hasSessionBus = sessionBusPresent();
    return env;
}

EnvironmentSnapshot snapshot() {
    QMutexLocker locker(&gSnapshotMutex);
    if (!gSnapshotReady) {
        gSnapshot = probe();
        gSnapshotReady = true;
    }
    return gSnapshot;
}

EnvironmentSnapshot refresh() {
    EnvironmentSnapshot fresh = probe();
    QMutexLocker locker(&gSnapshotMutex);
    gSnapshot = fresh;
    gSnapshotReady = true;
    return gSnapshot;
}

void logDiagnostics(const EnvironmentSnapshot &env) {
    logEvent(QStringLiteral("env: display=%1 desktop=%2 session_bus=%3")
                 .arg(toString(env.displayServer),
                      env.desktop.isEmpty() ? QStringLiteral("unknown") : env.desktop,
                      yesNo(env.hasSessionBus)));
    logEvent(QStringLiteral("tools: xdotool=%1 wmctrl=%2 xprop=%3")
                 .arg(yesNo(env.hasWindowQueryTool), yesNo(env.hasWindowControlTool), yesNo(env.hasWindowPropertyTool)));
    for (const char *tool : {kWindowQueryTool, kWindowControlTool, kWindowPropertyTool}) {
        const QString name = QString::fromLatin1(tool);
        QString reason;
        if (hasExecutable(name) && findTrustedTool(name, &reason).isEmpty()) {
            logEvent(QStringLiteral("env_warning: ignoring untrusted %1 at %2 (%3)")
                         .arg(name, findExecutableCached(name), reason));
        }
    }
    static const char *vars[] = {"XDG_CURRENT_DESKTOP", "DESKTOP_SESSION", "XDG_SESSION_TYPE",
                                 "WAYLAND_DISPLAY", "DISPLAY", "GDMSESSION"};
    QStringList parts;
    for (const char *k : vars) {
        const QString value = qEnvironmentVariable(k);
        parts << QStringLiteral("%1=%2").arg(QString::fromLatin1(k), value.isEmpty() ? QStringLiteral("-") : value);
    }
    debugLog(QStringLiteral("env_debug: ") + parts.join(' '));

    if (env.displayServer == DisplayServer::Wayland && !env.hasSessionBus) {
        logEvent(QStringLiteral("env_warning: wayland without session bus, folder detection limited to fallback"));
    } else if (env.displayServer == DisplayServer::X11 && !env.hasWindowQueryTool) {
        logEvent(QStringLiteral("env_warning: x11 without xdotool, active window detection disabled"));
    }

    static const char *editors[] = {"code", "code-insiders", "codium", "vscodium"};
    QStringList found;
    for (const char *e : editors) {
        const QString path = findExecutableCached(QString::fromLatin1(e));
        if (!path.isEmpty()) found << path;
    }
    if (found.isEmpty()) {
        logEvent(QStringLiteral("env_warning: no well-known editor on PATH, fallback locations will be tried"));
    } else {
        debugLog(QStringLiteral("editors_on_path: ") + found.join(' '));
    }
}

}

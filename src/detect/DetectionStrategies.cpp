#include "detect/DetectionStrategies.h"

#include "core/Log.h"
#include "detect/TitleHeuristics.h"
#include "safety/PathSafety.h"

#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>

namespace Detection {

namespace {

bool isExistingDir(const QString &path) {
    return !path.isEmpty() && QFileInfo(path).isDir();
}

}

int boundedTimeout(int timeoutMs, const QDeadlineTimer &deadline) {
    if (deadline.isForever()) return timeoutMs;
    const qint64 remaining = deadline.remainingTime();
    return remaining < timeoutMs ? static_cast<int>(qMax<qint64>(remaining, 0)) : timeoutMs;
}

QString fromSessionBus(const EnvironmentSnapshot &env, DesktopTools &tools, const QDeadlineTimer &deadline) {
    if (!env.hasSessionBus || !env.hasWindowQueryTool) return QString();

    const QStringList windows = tools.windowsByClass(QString::fromLatin1(kFileManagerClass),
                                                     boundedTimeout(kWindowSearchTimeoutMs, deadline));
    if (windows.isEmpty()) return QString();
    const QString focused = tools.focusedWindow(boundedTimeout(kFocusedWindowTimeoutMs, deadline));
    if (focused.isEmpty() || !windows.contains(focused)) {
        debugLog(QStringLiteral("bus_skip: file manager not focused"));
        return QString();
    }

    const QString reply = tools.busProperty(QString::fromLatin1(kFileManagerService),
                                            QString::fromLatin1(kFileManagerWindowPath),
                                            QString::fromLatin1(kFileManagerWindowInterface),
                                            QString::fromLatin1(kLocationProperty),
                                            boundedTimeout(kBusCallTimeoutMs, deadline));
    const QString path = locationFromBusReply(reply);
    return isExistingDir(path) ? path : QString();
}

QString fromActiveWindow(const EnvironmentSnapshot &env, DesktopTools &tools, const QDeadlineTimer &deadline) {
    if (!env.hasWindowQueryTool) return QString();

    const QString windowId = tools.activeWindow(boundedTimeout(kActiveWindowTimeoutMs, deadline));
    if (windowId.isEmpty()) return QString();
    const QString title = tools.windowTitle(windowId, boundedTimeout(kWindowNameTimeoutMs, deadline));
    if (!looksLikeFileManagerTitle(title)) {
        debugLog(QStringLiteral("active_window_skip: title=\"%1\" score=%2").arg(title).arg(fileManagerTitleScore(title)));
        return QString();
    }

    const QString fromTitle = extractDirectoryFromTitle(title, deadline);
    if (isExistingDir(fromTitle)) return fromTitle;
    return fromWindowProperties(env, tools, windowId, deadline);
}

QString directoryFromPropertyText(const QString &text) {
    static const QRegularExpression uriRe(QStringLiteral("[\"']([^\"']*file://[^\"']*)[\"']"));
    auto uris = uriRe.globalMatch(text);
    while (uris.hasNext()) {
        const QString quoted = uris.next().captured(1);
        const int at = quoted.indexOf(QLatin1String("file://"));
        const QString path = localPathFromUri(quoted.mid(at));
        if (isExistingDir(path)) return path;
    }

    static const QRegularExpression pathRe(QStringLiteral("[\"']([^\"']*(?:/[^/\"'\\s]+)+)[\"']"));
    auto paths = pathRe.globalMatch(text);
    while (paths.hasNext()) {
        const QString path = expandHome(paths.next().captured(1));
        if (isExistingDir(path)) return path;
    }
    return QString();
}

QString fromWindowProperties(const EnvironmentSnapshot &env, DesktopTools &tools, const QString &windowId,
                             const QDeadlineTimer &deadline) {
    if (!env.hasWindowPropertyTool || windowId.isEmpty()) return QString();
    const QString output = tools.windowProperties(windowId, {QStringLiteral("WM_NAME"), QStringLiteral("_NET_WM_NAME")},
                                                  boundedTimeout(kWindowPropertyTimeoutMs, deadline));
    if (output.isEmpty()) return QString();
    return directoryFromPropertyText(output);
}

QString fromFilesystemFallback() {
    const QString cwd = QDir::currentPath();
    if (isUsableDirectory(cwd)) return cwd;

    const QString home = QDir::homePath();
    static const char *common[] = {"Desktop", "Escritorio", "Documents", "Documentos"};
    for (const char *name : common) {
        const QString path = home + '/' + QString::fromLatin1(name);
        if (isUsableDirectory(path)) return path;
    }
    return isUsableDirectory(home) ? home : QString();
}

}

#include "core/Log.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QTemporaryDir>
#include <QTextStream>

#include <sys/stat.h>
#include <unistd.h>

namespace {

QMutex gLogMutex;

void rotateLogsIfNeeded(const QString &log) {
    QFileInfo fi(log);
    const qint64 maxSize = 1024 * 1024;
    if (fi.exists() && fi.size() > maxSize) {
        QFile::remove(log + ".2");
        QFile::rename(log + ".1", log + ".2");
        QFile::rename(log, log + ".1");
    }
}

}

bool ensurePrivateDir(const QString &path) {
    const QByteArray encoded = QFile::encodeName(path);
    struct stat st{};
    if (::lstat(encoded.constData(), &st) == 0) {
        if (S_ISLNK(st.st_mode)) {
            return false;
        }
        if (!S_ISDIR(st.st_mode)) {
            return false;
        }
        if (st.st_uid != getuid()) {
            return false;
        }
        if ((st.st_mode & (S_IRWXG | S_IRWXO)) != 0) {
            if (::chmod(encoded.constData(), S_IRWXU) != 0) {
                return false;
            }
        }
        return true;
    }

    QDir dir;
    if (!dir.mkpath(path)) {
        return false;
    }
    if (::chmod(encoded.constData(), S_IRWXU) != 0) {
        return false;
    }
    if (::lstat(encoded.constData(), &st) != 0) {
        return false;
    }
    return S_ISDIR(st.st_mode) && st.st_uid == getuid() && (st.st_mode & (S_IRWXG | S_IRWXO)) == 0;
}

QString stateDirPath() {
    const QString dir = QDir::homePath() + "/.local/state";
    ensurePrivateDir(dir);
    return dir;
}

QString logFilePath() { return stateDirPath() + "/active-folder-tray.log"; }

QString runtimeDirPath() {
    static QString cachedRuntimePath;
    if (!cachedRuntimePath.isEmpty()) {
        return cachedRuntimePath;
    }
    const QString xdg = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (!xdg.isEmpty()) {
        QFileInfo fi(xdg);
        const QFile::Permissions req = QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner;
        if (fi.exists() && fi.isDir() && fi.ownerId() == (uint)getuid()) {
            QFile::Permissions p = fi.permissions();
            if ((p & req) == req && !(p & (QFile::ReadGroup | QFile::WriteGroup | QFile::ExeGroup | QFile::ReadOther | QFile::WriteOther | QFile::ExeOther))) {
                cachedRuntimePath = xdg;
                return cachedRuntimePath;
            }
        }
    }
    const QString fallback = QStringLiteral("/tmp/active-folder-tray-%1").arg(getuid());
    if (ensurePrivateDir(fallback)) {
        cachedRuntimePath = fallback;
        return cachedRuntimePath;
    }
    QTemporaryDir tmp(QStringLiteral("/tmp/active-folder-tray-fallback-XXXXXX"));
    tmp.setAutoRemove(false);
    cachedRuntimePath = tmp.path();
    ensurePrivateDir(cachedRuntimePath);
    return cachedRuntimePath;
}

void logEvent(const QString &message) {
    QMutexLocker locker(&gLogMutex);
    const QString log = logFilePath();
    rotateLogsIfNeeded(log);
    QFile f(log);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) return;
    f.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    QTextStream out(&f);
    out << QDateTime::currentDateTimeUtc().toString(Qt::ISODate) << " " << message << "\n";
}

bool debugEnabled() {
    static const bool enabled = qEnvironmentVariableIsSet("ACTIVE_FOLDER_LOG_DEBUG");
    return enabled;
}

void debugLog(const QString &message) {
    if (debugEnabled()) logEvent(message);
}

#include "core/ExecutableLookup.h"

#include "core/Log.h"

#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QMutex>
#include <QMutexLocker>
#include <QRegularExpression>
#include <QStandardPaths>
#include <QStringList>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

QMutex gLookupMutex;
QHash<QString, QString> gLookupCache;

bool isRootHostUidMapped() {
    QFile f(QStringLiteral("/proc/self/uid_map"));
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return true;
    }
    const QStringList lines = QString::fromLatin1(f.readAll()).split('\n', Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        const QStringList parts = line.trimmed().split(QRegularExpression("\\s+"));
        if (parts.size() < 3) continue;
        bool ok1 = false, ok2 = false;
        const quint64 outside = parts.at(1).toULongLong(&ok1);
        const quint64 length = parts.at(2).toULongLong(&ok2);
        if (ok1 && ok2 && outside == 0 && length > 0) {
            return true;
        }
    }
    return false;
}

}

QString findExecutableCached(const QString &name) {
    if (name.isEmpty()) return QString();
    {
        QMutexLocker locker(&gLookupMutex);
        const auto it = gLookupCache.constFind(name);
        if (it != gLookupCache.constEnd()) return it.value();
    }
    const QString found = QStandardPaths::findExecutable(name);
    QMutexLocker locker(&gLookupMutex);
    gLookupCache.insert(name, found);
    return found;
}

bool hasExecutable(const QString &name) {
    return !findExecutableCached(name).isEmpty();
}

void clearExecutableCache() {
    QMutexLocker locker(&gLookupMutex);
    gLookupCache.clear();
}

bool isRootOwnedConsideringUserNS(uid_t uid) {
    if (uid == 0) return true;
    const uid_t overflowUid = 65534;
    return uid == overflowUid && !isRootHostUidMapped();
}

bool isExecutableTrustedDetailed(const QString &path, QString *reasonOut) {
    QFileInfo fi(path);
    if (!fi.exists()) { if (reasonOut) *reasonOut = QStringLiteral("not found"); return false; }
    if (!fi.isExecutable()) { if (reasonOut) *reasonOut = QStringLiteral("not executable"); return false; }
    if (fi.isSymLink()) { if (reasonOut) *reasonOut = QStringLiteral("symlink not allowed"); return false; }
    const QString real = fi.canonicalFilePath();
    if (real.isEmpty()) { if (reasonOut) *reasonOut = QStringLiteral("canonicalize failed"); return false; }
    if (real != path) { if (reasonOut) *reasonOut = QStringLiteral("path mismatch"); return false; }
    if (!(real.startsWith("/usr/") || real.startsWith("/bin/") || real.startsWith("/sbin/"))) {
        if (reasonOut) *reasonOut = QStringLiteral("outside trusted prefix");
        return false;
    }
    const QByteArray encoded = QFile::encodeName(real);
    const int fd = ::open(encoded.constData(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW);
    if (fd < 0) { if (reasonOut) *reasonOut = QStringLiteral("open failed"); return false; }
    struct stat st{};
    const bool ok = (::fstat(fd, &st) == 0);
    ::close(fd);
    if (!ok) { if (reasonOut) *reasonOut = QStringLiteral("stat failed"); return false; }
    if (!S_ISREG(st.st_mode)) { if (reasonOut) *reasonOut = QStringLiteral("not a regular file"); return false; }
    if (!isRootOwnedConsideringUserNS(st.st_uid)) { if (reasonOut) *reasonOut = QStringLiteral("not root-owned"); return false; }
    if ((st.st_mode & S_IWGRP) || (st.st_mode & S_IWOTH)) { if (reasonOut) *reasonOut = QStringLiteral("group- or world-writable"); return false; }
    return true;
}

QString findTrustedTool(const QString &name, QString *reasonOut) {
    const QString located = findExecutableCached(name);
    if (located.isEmpty()) {
        if (reasonOut) *reasonOut = QStringLiteral("not found");
        return QString();
    }
    if (QFileInfo(located).isSymLink()) {
        if (reasonOut) *reasonOut = QStringLiteral("symlink not allowed");
        debugLog(QStringLiteral("tool_untrusted: %1 (symlink not allowed)").arg(located));
        return QString();
    }
    // Merged-/usr systems put /bin on PATH as a directory symlink; trust is judged on the real file.
    const QString real = QFileInfo(located).canonicalFilePath();
    QString reason;
    if (!isExecutableTrustedDetailed(real, &reason)) {
        if (reasonOut) *reasonOut = reason;
        debugLog(QStringLiteral("tool_untrusted: %1 (%2)").arg(located, reason));
        return QString();
    }
    if (reasonOut) reasonOut->clear();
    return real;
}

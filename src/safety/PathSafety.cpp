#include "safety/PathSafety.h"

#include <QDir>
#include <QFileInfo>

#include <unistd.h>

namespace {

QString normalizeRoot(const QString &root) {
    const QString canon = QFileInfo(root).canonicalFilePath();
    QString n = canon.isEmpty() ? QDir::cleanPath(root) : canon;
    if (n.size() > 1 && n.endsWith('/')) n.chop(1);
    return n;
}

}

const QStringList &forbiddenDirectories() {
    static const QStringList dirs = {
        QStringLiteral("/root"), QStringLiteral("/etc"), QStringLiteral("/sys"),
        QStringLiteral("/proc"), QStringLiteral("/dev"), QStringLiteral("/boot"),
        QStringLiteral("/var/log"), QStringLiteral("/usr/sbin"), QStringLiteral("/sbin"),
        QStringLiteral("/bin"), QStringLiteral("/usr/bin")
    };
    return dirs;
}

QStringList allowedRoots() {
    QStringList roots;
    roots << QDir::homePath()
          << QStringLiteral("/tmp") << QStringLiteral("/var/tmp") << QDir::tempPath()
          << QStringLiteral("/opt") << QStringLiteral("/usr/local")
          << QStringLiteral("/media") << QStringLiteral("/mnt") << QStringLiteral("/run/media");
    QStringList normalized;
    for (const QString &r : roots) {
        const QString n = normalizeRoot(r);
        if (!n.isEmpty() && n != QLatin1String("/") && !normalized.contains(n)) normalized << n;
    }
    return normalized;
}

QString expandHome(const QString &candidate) {
    if (candidate == QLatin1String("~")) return QDir::homePath();
    if (candidate.startsWith(QLatin1String("~/"))) return QDir::homePath() + candidate.mid(1);
    return candidate;
}

bool isSameOrSubPath(const QString &path, const QString &root) {
    if (root.isEmpty() || path.isEmpty()) return false;
    if (path == root) return true;
    const QString prefix = root.endsWith('/') ? root : root + '/';
    return path.startsWith(prefix);
}

ValidatedPath validateDirectory(const QString &candidate, QString *reasonOut) {
    const QString trimmed = candidate.trimmed();
    if (trimmed.isEmpty()) {
        if (reasonOut) *reasonOut = QStringLiteral("empty path");
        return ValidatedPath();
    }
    QFileInfo fi(expandHome(trimmed));
    const QString real = fi.canonicalFilePath();
    if (real.isEmpty()) {
        if (reasonOut) *reasonOut = QStringLiteral("does not exist");
        return ValidatedPath();
    }
    QFileInfo rfi(real);
    if (!rfi.isDir()) {
        if (reasonOut) *reasonOut = QStringLiteral("not a directory");
        return ValidatedPath();
    }
    const QByteArray encoded = QFile::encodeName(real);
    if (::access(encoded.constData(), R_OK) != 0) {
        if (reasonOut) *reasonOut = QStringLiteral("not readable");
        return ValidatedPath();
    }
    if (forbiddenDirectories().contains(real)) {
        if (reasonOut) *reasonOut = QStringLiteral("forbidden system directory: %1").arg(real);
        return ValidatedPath();
    }
    const QStringList roots = allowedRoots();
    for (const QString &root : roots) {
        if (isSameOrSubPath(real, root)) {
            if (reasonOut) reasonOut->clear();
            return ValidatedPath(real);
        }
    }
    if (reasonOut) *reasonOut = QStringLiteral("outside allowed locations: %1").arg(real);
    return ValidatedPath();
}

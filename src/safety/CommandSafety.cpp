#include "safety/CommandSafety.h"

#include "core/ExecutableLookup.h"

#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>

#include <sys/stat.h>
#include <unistd.h>

namespace {

bool inSystemBinaryDir(const QString &path, const QStringList &systemDirs) {
    for (const QString &dir : systemDirs) {
        if (path.startsWith(dir)) return true;
    }
    return false;
}

bool fail(QString *reasonOut, const QString &reason) {
    if (reasonOut) *reasonOut = reason;
    return false;
}

// Existence, type, executable bit and size ceiling on an already resolved path.
bool checkExecutableFile(const QString &real, struct stat *stOut, QString *reasonOut) {
    const QByteArray encoded = QFile::encodeName(real);
    struct stat st{};
    if (::stat(encoded.constData(), &st) != 0) return fail(reasonOut, QStringLiteral("not found"));
    if (!S_ISREG(st.st_mode)) return fail(reasonOut, QStringLiteral("not a regular file"));
    if (::access(encoded.constData(), X_OK) != 0) return fail(reasonOut, QStringLiteral("not executable"));
    if (static_cast<qint64>(st.st_size) > kMaxExecutableBytes) return fail(reasonOut, QStringLiteral("implausibly large binary"));
    if (st.st_mode & S_IWOTH) return fail(reasonOut, QStringLiteral("world-writable"));
    *stOut = st;
    return true;
}

}

const QSet<QString> &deniedCommands() {
    static const QSet<QString> denied = {
        // shells and interpreters
        "sh", "bash", "zsh", "dash", "fish", "ksh", "csh", "tcsh",
        "python", "perl", "ruby", "node", "env", "xargs",
        // privilege escalation
        "sudo", "su", "doas", "pkexec",
        // filesystem destructive
        "rm", "dd", "mkfs", "fdisk", "parted", "wipefs", "shred", "chmod", "chown",
        // process and system control
        "kill", "killall", "pkill", "shutdown", "reboot", "halt", "poweroff", "init",
        "systemctl", "service",
        // remote fetch
        "wget", "curl", "nc", "netcat", "ssh", "scp"
    };
    return denied;
}

const QStringList &deniedCommandPrefixes() {
    static const QStringList prefixes = {QStringLiteral("rm"), QStringLiteral("mkfs"), QStringLiteral("python")};
    return prefixes;
}

const QSet<QString> &knownSafeEditors() {
    static const QSet<QString> editors = {
        "code", "code-insiders", "codium", "vscodium",
        "vim", "nvim", "vi", "nano", "emacs", "gedit", "kate",
        "sublime_text", "subl", "atom", "notepad++",
        "mousepad", "pluma", "xed", "geany", "brackets"
    };
    return editors;
}

const QStringList &systemBinaryDirectories() {
    static const QStringList dirs = {
        QStringLiteral("/bin/"), QStringLiteral("/sbin/"), QStringLiteral("/usr/bin/"),
        QStringLiteral("/usr/sbin/"), QStringLiteral("/usr/local/bin/")
    };
    return dirs;
}

QString commandToken(const QString &candidate) {
    const QStringList parts = candidate.trimmed().split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
    return parts.isEmpty() ? QString() : parts.first();
}

bool isDeniedCommand(const QString &basename) {
    if (deniedCommands().contains(basename)) return true;
    for (const QString &prefix : deniedCommandPrefixes()) {
        if (basename.startsWith(prefix)) return true;
    }
    return false;
}

bool matchesSafeEditor(const QString &basename, const QString &resolvedPath) {
    if (knownSafeEditors().contains(basename)) return true;
    const QString lower = resolvedPath.toLower();
    for (const QString &editor : knownSafeEditors()) {
        if (lower.contains(editor)) return true;
    }
    return false;
}

ValidatedCommand validateCommand(const QString &candidate, QString *reasonOut) {
    return validateCommand(candidate, systemBinaryDirectories(), reasonOut);
}

ValidatedCommand validateCommand(const QString &candidate, const QStringList &systemDirs, QString *reasonOut) {
    const QString token = commandToken(candidate);
    if (token.isEmpty()) {
        fail(reasonOut, QStringLiteral("empty command"));
        return ValidatedCommand();
    }
    const QString base = QFileInfo(token).fileName();
    if (base.isEmpty() || isDeniedCommand(base)) {
        fail(reasonOut, QStringLiteral("denied command: %1").arg(base));
        return ValidatedCommand();
    }

    const bool absolute = token.startsWith('/');
    QString located = token;
    if (!absolute) {
        if (token.contains('/')) {
            fail(reasonOut, QStringLiteral("relative paths are not accepted"));
            return ValidatedCommand();
        }
        located = findExecutableCached(token);
        if (located.isEmpty()) {
            fail(reasonOut, QStringLiteral("not found on search path: %1").arg(token));
            return ValidatedCommand();
        }
    }

    const QString real = QFileInfo(located).canonicalFilePath();
    if (real.isEmpty()) {
        fail(reasonOut, QStringLiteral("not found"));
        return ValidatedCommand();
    }
    const QString realBase = QFileInfo(real).fileName();
    if (isDeniedCommand(realBase)) {
        fail(reasonOut, QStringLiteral("resolves to denied command: %1").arg(realBase));
        return ValidatedCommand();
    }
    struct stat st{};
    if (!checkExecutableFile(real, &st, reasonOut)) {
        return ValidatedCommand();
    }
    if (!matchesSafeEditor(base, real) && !matchesSafeEditor(realBase, real)) {
        fail(reasonOut, QStringLiteral("not a known editor: %1").arg(real));
        return ValidatedCommand();
    }

    if (absolute) {
        if (inSystemBinaryDir(real, systemDirs)) {
            if (!knownSafeEditors().contains(base) && !knownSafeEditors().contains(realBase)) {
                fail(reasonOut, QStringLiteral("system binary is not an allow-listed editor"));
                return ValidatedCommand();
            }
        } else if (st.st_uid != getuid() && !isRootOwnedConsideringUserNS(st.st_uid)) {
            fail(reasonOut, QStringLiteral("not owned by current user (uid=%1, expected=%2)").arg(st.st_uid).arg(getuid()));
            return ValidatedCommand();
        }
    }

    if (reasonOut) reasonOut->clear();
    return ValidatedCommand(real, token);
}

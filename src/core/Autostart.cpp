#include "core/Autostart.h"

#include "core/Log.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>

QString autostartFilePath() {
    return QDir::homePath() + "/.config/autostart/active-folder-tray.desktop";
}

bool isAutostartEnabled() {
    return QFileInfo(autostartFilePath()).isFile();
}

QString desktopEntryExecQuote(const QString &path) {
    QString quoted;
    quoted.reserve(path.size() + 2);
    quoted += '"';
    for (const QChar c : path) {
        if (c == '"' || c == '`' || c == '$' || c == '\\') quoted += '\\';
        quoted += c;
    }
    quoted += '"';
    // Desktop entry values unescape backslashes once before Exec is parsed.
    quoted.replace(QLatin1String("\\"), QLatin1String("\\\\"));
    return quoted;
}

bool enableAutostart(const QString &executablePath, QString *reasonOut) {
    const QFileInfo fi(executablePath);
    if (!fi.isAbsolute() || !fi.isFile() || !fi.isExecutable()) {
        if (reasonOut) *reasonOut = QStringLiteral("not an executable file: %1").arg(executablePath);
        return false;
    }
    if (executablePath.contains('\n') || executablePath.contains('\r')) {
        if (reasonOut) *reasonOut = QStringLiteral("invalid executable path");
        return false;
    }
    const QString path = autostartFilePath();
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        if (reasonOut) *reasonOut = QStringLiteral("cannot create autostart directory");
        return false;
    }
    QSaveFile sf(path);
    if (!sf.open(QIODevice::WriteOnly | QIODevice::Text)) {
        if (reasonOut) *reasonOut = sf.errorString();
        return false;
    }
    {
        QTextStream out(&sf);
        out << "[Desktop Entry]\n"
            << "Type=Application\n"
            << "Name=Active Folder\n"
            << "Comment=Open the folder shown in the file manager in your editor\n"
            << "Exec=" << desktopEntryExecQuote(executablePath) << '\n'
            << "Icon=folder-open\n"
            << "Terminal=false\n"
            << "Hidden=false\n"
            << "X-GNOME-Autostart-enabled=true\n"
            << "Categories=Utility;Development;\n"
            << "StartupNotify=false\n";
    }
    sf.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ReadGroup | QFileDevice::ReadOther);
    if (!sf.commit()) {
        if (reasonOut) *reasonOut = sf.errorString();
        logEvent(QStringLiteral("autostart_enable_failed: ") + sf.errorString());
        return false;
    }
    if (reasonOut) reasonOut->clear();
    logEvent(QStringLiteral("autostart_enabled: ") + path);
    return true;
}

bool disableAutostart() {
    QFile f(autostartFilePath());
    if (!f.exists()) return true;
    if (!f.remove()) {
        logEvent(QStringLiteral("autostart_disable_failed: ") + f.errorString());
        return false;
    }
    logEvent(QStringLiteral("autostart_disabled"));
    return true;
}

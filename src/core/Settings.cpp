#include "core/Settings.h"

#include "core/Log.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSaveFile>
#include <QStringList>
#include <QTextStream>
#include <QUrl>

namespace {

constexpr int kMaxLineLength = 4096;
const char *const kEditorKey = "EDITOR_COMMAND";
const char *const kFavoritesKey = "FAVORITE_FOLDERS";

bool isValidKey(const QString &key) {
    static const QRegularExpression re(QStringLiteral("^[A-Z][A-Z0-9_]{0,63}$"));
    return re.match(key).hasMatch();
}

}

QString configDirPath() { return QDir::homePath() + "/.config/active-folder-tray"; }
QString configFilePath() { return configDirPath() + "/config"; }

QString readSettingValue(const QString &filePath, const QString &key) {
    if (!isValidKey(key)) return QString();
    QFile f(filePath);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) return QString();
    QTextStream in(&f);
    const QRegularExpression re(QStringLiteral("^%1=(.*)$").arg(key));
    while (!in.atEnd()) {
        const QString line = in.readLine();
        if (line.size() > kMaxLineLength) continue;
        const auto m = re.match(line);
        if (m.hasMatch()) return m.captured(1).trimmed();
    }
    return QString();
}

bool writeSettingValue(const QString &filePath, const QString &key, const QString &value) {
    if (!isValidKey(key)) return false;
    if (value.contains('\n') || value.contains('\r') || value.size() > kMaxLineLength - key.size() - 1) return false;
    const QString dir = QFileInfo(filePath).absolutePath();
    if (!ensurePrivateDir(dir)) {
        logEvent(QStringLiteral("settings_dir_insecure: ") + dir);
        return false;
    }
    QFile rf(filePath);
    QString content;
    if (rf.exists()) {
        if (!rf.open(QIODevice::ReadOnly | QIODevice::Text)) return false;
        content = QString::fromUtf8(rf.readAll());
        rf.close();
    }
    QStringList lines = content.split('\n');
    const QString prefix = key + '=';
    bool found = false;
    for (QString &l : lines) {
        if (l.startsWith(prefix)) {
            l = prefix + value;
            found = true;
        }
    }
    if (!found) {
        if (!lines.isEmpty() && lines.last().isEmpty()) lines.removeLast();
        lines << prefix + value;
    }
    QSaveFile sf(filePath);
    if (!sf.open(QIODevice::WriteOnly | QIODevice::Text)) return false;
    {
        QTextStream out(&sf);
        for (int i = 0; i < lines.size(); ++i) {
            if (i == lines.size() - 1 && lines[i].isEmpty()) continue;
            out << lines[i] << '\n';
        }
    }
    sf.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    return sf.commit();
}

QString encodeFolderList(const QStringList &folders) {
    QStringList encoded;
    for (const QString &folder : folders) {
        if (!folder.startsWith('/')) continue;
        encoded << QString::fromLatin1(QUrl::fromLocalFile(folder).toEncoded());
    }
    return encoded.join(' ');
}

QStringList decodeFolderList(const QString &value) {
    QStringList folders;
    const QStringList tokens = value.split(' ', Qt::SkipEmptyParts);
    for (const QString &token : tokens) {
        const QUrl url = QUrl::fromEncoded(token.toLatin1(), QUrl::StrictMode);
        if (!url.isValid() || !url.isLocalFile()) continue;
        const QString path = url.toLocalFile();
        if (!path.isEmpty() && !folders.contains(path)) folders << path;
    }
    return folders;
}

FileSettingsStore::FileSettingsStore() : filePath_(configFilePath()) {}

FileSettingsStore::FileSettingsStore(const QString &filePath) : filePath_(filePath) {}

QString FileSettingsStore::editorCommand() const {
    const QString value = readSettingValue(filePath_, QString::fromLatin1(kEditorKey));
    return value.isEmpty() ? QString::fromLatin1(kDefaultEditorCommand) : value;
}

bool FileSettingsStore::setEditorCommand(const QString &command) {
    const QString trimmed = command.trimmed();
    if (trimmed.isEmpty()) return false;
    if (!writeSettingValue(filePath_, QString::fromLatin1(kEditorKey), trimmed)) {
        logEvent(QStringLiteral("settings_write_failed: ") + filePath_);
        return false;
    }
    logEvent(QStringLiteral("settings_updated: EDITOR_COMMAND=") + trimmed);
    return true;
}

QStringList FileSettingsStore::favoriteFolders() const {
    return decodeFolderList(readSettingValue(filePath_, QString::fromLatin1(kFavoritesKey)));
}

bool FileSettingsStore::setFavoriteFolders(const QStringList &folders) {
    if (!writeSettingValue(filePath_, QString::fromLatin1(kFavoritesKey), encodeFolderList(folders))) {
        logEvent(QStringLiteral("settings_write_failed: ") + filePath_);
        return false;
    }
    logEvent(QStringLiteral("settings_updated: FAVORITE_FOLDERS (%1 entries)").arg(folders.size()));
    return true;
}

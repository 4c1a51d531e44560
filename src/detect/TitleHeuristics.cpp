#include "detect/TitleHeuristics.h"

#include "core/Log.h"
#include "safety/PathSafety.h"

#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSet>
#include <QUrl>

namespace {

bool isExistingDir(const QString &path) {
    return !path.isEmpty() && QFileInfo(path).isDir();
}

bool isDecorativeGlyph(QChar c) {
    switch (c.unicode()) {
    case 0x2733: // ✳
    case 0x2605: // ★
    case 0x2022: // •
    case 0x25CF: // ●
    case '*':
        return true;
    default:
        return c.isSpace();
    }
}

bool startsWithWord(const QString &text, const QString &word) {
    if (!text.startsWith(word, Qt::CaseInsensitive)) return false;
    if (text.size() == word.size()) return true;
    const QChar next = text.at(word.size());
    return next.isSpace() || next == '-' || next == QChar(0x2014) || next == ':';
}

bool hasApplicationSuffix(const QString &title) {
    return title.contains(QLatin1String(" - ")) || title.contains(QStringLiteral(" — "))
        || title.contains(QStringLiteral(" – "));
}

const QStringList &ownWindowTitles() {
    static const QStringList titles = {QStringLiteral("Active Folder"), QStringLiteral("active-folder-tray")};
    return titles;
}

}

const QVector<QPair<QString, QString>> &specialFolderNames() {
    static const QVector<QPair<QString, QString>> names = {
        {QStringLiteral("Documents"), QStringLiteral("Documents")},
        {QStringLiteral("Documentos"), QStringLiteral("Documents")},
        {QStringLiteral("Downloads"), QStringLiteral("Downloads")},
        {QStringLiteral("Descargas"), QStringLiteral("Downloads")},
        {QStringLiteral("Pictures"), QStringLiteral("Pictures")},
        {QStringLiteral("Imágenes"), QStringLiteral("Pictures")},
        {QStringLiteral("Music"), QStringLiteral("Music")},
        {QStringLiteral("Música"), QStringLiteral("Music")},
        {QStringLiteral("Videos"), QStringLiteral("Videos")},
        {QStringLiteral("Vídeos"), QStringLiteral("Videos")},
        {QStringLiteral("Desktop"), QStringLiteral("Desktop")},
        {QStringLiteral("Escritorio"), QStringLiteral("Desktop")},
        {QStringLiteral("Public"), QStringLiteral("Public")},
        {QStringLiteral("Público"), QStringLiteral("Public")},
        {QStringLiteral("Templates"), QStringLiteral("Templates")},
        {QStringLiteral("Plantillas"), QStringLiteral("Templates")}
    };
    return names;
}

const QStringList &homeFolderAliases() {
    static const QStringList aliases = {QStringLiteral("home"), QStringLiteral("carpeta personal"),
                                        QStringLiteral("personal folder")};
    return aliases;
}

const QStringList &fileManagerBrandPrefixes() {
    static const QStringList prefixes = {QStringLiteral("Files"), QStringLiteral("Archivos"),
                                         QStringLiteral("File Manager"), QStringLiteral("Gestor de archivos")};
    return prefixes;
}

const QStringList &nameSearchExcludedDirs() {
    static const QStringList dirs = {
        "node_modules", "__pycache__", ".git", ".svn", ".hg",
        ".cache", ".config", ".local", ".npm", ".cargo", ".rustup",
        "venv", "env", ".venv", ".env", "virtualenv",
        "site-packages", "dist", "build", ".tox",
        "snap", "flatpak", ".wine", ".steam",
        ".mozilla", ".thunderbird", ".var"
    };
    return dirs;
}

int fileManagerTitleScore(const QString &rawTitle) {
    const QString title = rawTitle.trimmed();
    if (title.isEmpty()) return 0;
    for (const QString &own : ownWindowTitles()) {
        if (title.contains(own, Qt::CaseInsensitive)) return -10;
    }
    int score = 0;
    const QString lower = title.toLower();
    if (lower.contains(QLatin1String("nautilus"))) score += 2;
    for (const QString &brand : fileManagerBrandPrefixes()) {
        if (startsWithWord(title, brand)) {
            score += 2;
            break;
        }
    }
    const QString stripped = stripTitleDecorations(title);
    if (stripped.startsWith('/') || stripped.startsWith('~')) score += 2;
    for (const auto &entry : specialFolderNames()) {
        if (lower.contains(entry.first.toLower())) {
            score += 1;
            break;
        }
    }
    if (homeFolderAliases().contains(stripped.toLower())) score += 1;
    if (score == 0 && !hasApplicationSuffix(title) && title.size() > 3) {
        // A bare name is how the file manager titles an arbitrary folder.
        score += 1;
    }
    return score;
}

bool looksLikeFileManagerTitle(const QString &title) {
    return fileManagerTitleScore(title) > 0;
}

QString stripTitleDecorations(const QString &title) {
    QString t = title.trimmed();
    for (const QString &prefix : fileManagerBrandPrefixes()) {
        if (startsWithWord(t, prefix)) {
            t = t.mid(prefix.size()).trimmed();
            if (t.startsWith('-') || t.startsWith(QChar(0x2014)) || t.startsWith(':')) t = t.mid(1).trimmed();
        }
    }
    int i = 0;
    while (i < t.size() && isDecorativeGlyph(t.at(i))) ++i;
    return t.mid(i).trimmed();
}

QString localPathFromUri(const QString &uri) {
    const QString trimmed = uri.trimmed();
    if (!trimmed.startsWith(QLatin1String("file://"))) return QString();
    const QUrl url(trimmed);
    if (!url.isValid() || !url.isLocalFile()) return QString();
    return url.toLocalFile();
}

QString locationFromBusReply(const QString &reply) {
    const QString direct = localPathFromUri(reply);
    if (!direct.isEmpty()) return direct;
    static const QRegularExpression re(QStringLiteral("['\"](file://[^'\"]+)['\"]"));
    auto it = re.globalMatch(reply);
    while (it.hasNext()) {
        const QString path = localPathFromUri(it.next().captured(1));
        if (!path.isEmpty()) return path;
    }
    return QString();
}

QString extractDirectoryFromTitle(const QString &title, const QDeadlineTimer &deadline) {
    if (title.trimmed().isEmpty()) return QString();
    const QString original = title;
    const QString t = expandHome(stripTitleDecorations(title));

    if (t.startsWith('/') && isExistingDir(t)) return t;

    static const QRegularExpression pathRe(QStringLiteral("(/[^\\s]+)"));
    auto it = pathRe.globalMatch(original);
    while (it.hasNext()) {
        const QString match = it.next().captured(1);
        if (isExistingDir(match)) return match;
    }

    if (t.isEmpty()) return QString();
    const QString home = QDir::homePath();
    const QString lower = t.toLower();
    if (homeFolderAliases().contains(lower)) return home;

    for (const auto &entry : specialFolderNames()) {
        if (lower == entry.first.toLower()) {
            const QString path = home + '/' + entry.second;
            if (isExistingDir(path)) return path;
        }
    }
    for (const auto &entry : specialFolderNames()) {
        if (lower.contains(entry.first.toLower())) {
            const QString path = home + '/' + entry.second;
            if (isExistingDir(path)) return path;
        }
    }

    if (t.contains('/')) return QString();
    const QString direct = home + '/' + t;
    if (isExistingDir(direct)) return direct;

    if (t == QLatin1String("org.gnome.Nautilus") || t == QLatin1String("Nautilus")) return QString();
    return searchFolderByName(t, deadline);
}

QStringList nameSearchRoots() {
    const QString home = QDir::homePath();
    const QStringList candidates = {
        home,
        home + "/Documents", home + "/Documentos",
        home + "/Desktop", home + "/Escritorio",
        home + "/Downloads", home + "/Descargas"
    };
    QStringList roots;
    for (const QString &c : candidates) {
        if (isExistingDir(c)) roots << c;
    }
    return roots;
}

QString findDirectoryByName(const QString &name, const QStringList &roots, int maxDepth,
                            const QDeadlineTimer &deadline) {
    if (name.isEmpty() || maxDepth <= 0) return QString();
    const QSet<QString> excluded(nameSearchExcludedDirs().cbegin(), nameSearchExcludedDirs().cend());
    QSet<QString> scanned;
    QStringList frontier = roots;
    for (int depth = 1; depth <= maxDepth && !frontier.isEmpty(); ++depth) {
        QStringList next;
        for (const QString &dir : frontier) {
            if (deadline.hasExpired()) {
                debugLog(QStringLiteral("name_search_timeout: ") + name);
                return QString();
            }
            const QString canon = QFileInfo(dir).canonicalFilePath();
            if (canon.isEmpty() || scanned.contains(canon)) continue;
            scanned.insert(canon);
            const QFileInfoList entries = QDir(dir).entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::NoSymLinks,
                                                                   QDir::Name);
            for (const QFileInfo &fi : entries) {
                if (deadline.hasExpired()) {
                    debugLog(QStringLiteral("name_search_timeout: ") + name);
                    return QString();
                }
                const QString entryName = fi.fileName();
                if (fi.isSymLink() || entryName.startsWith('.') || excluded.contains(entryName)) continue;
                if (entryName.compare(name, Qt::CaseInsensitive) == 0) return fi.absoluteFilePath();
                if (depth < maxDepth) next << fi.absoluteFilePath();
            }
        }
        frontier = next;
    }
    return QString();
}

QString searchFolderByName(const QString &name, const QDeadlineTimer &deadline) {
    QDeadlineTimer budget(kNameSearchBudgetMs);
    if (deadline.deadline() < budget.deadline()) budget = deadline;
    return findDirectoryByName(name, nameSearchRoots(), kNameSearchMaxDepth, budget);
}

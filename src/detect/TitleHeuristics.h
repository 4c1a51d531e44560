#pragma once

#include <QDeadlineTimer>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QVector>

constexpr int kNameSearchMaxDepth = 2;
constexpr int kNameSearchBudgetMs = 2000;

// Display name -> subdirectory of home. Covers English and Spanish.
const QVector<QPair<QString, QString>> &specialFolderNames();
const QStringList &homeFolderAliases();
const QStringList &fileManagerBrandPrefixes();
const QStringList &nameSearchExcludedDirs();

// Positive score when the window title plausibly belongs to the file manager.
int fileManagerTitleScore(const QString &title);
bool looksLikeFileManagerTitle(const QString &title);

QString stripTitleDecorations(const QString &title);

// file:// URI -> local path, percent-decoded. Empty for anything else.
QString localPathFromUri(const QString &uri);
// Finds the first file:// URI in a textual bus reply such as "(<'file:///home/u'>,)".
QString locationFromBusReply(const QString &reply);

QString extractDirectoryFromTitle(const QString &title, const QDeadlineTimer &deadline);

QStringList nameSearchRoots();
// Case-insensitive, depth-limited directory name search that never follows
// symlinks. Returns an empty string once the deadline expires.
QString findDirectoryByName(const QString &name, const QStringList &roots, int maxDepth,
                            const QDeadlineTimer &deadline);
QString searchFolderByName(const QString &name, const QDeadlineTimer &deadline);

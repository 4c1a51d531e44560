#pragma once

#include <QSet>
#include <QString>
#include <QStringList>

// An absolute, symlink-resolved executable that passed validateCommand().
class ValidatedCommand {
public:
    ValidatedCommand() = default;

    bool isValid() const { return !path_.isEmpty(); }
    const QString &path() const { return path_; }
    // The token the command was validated from ("code", "/usr/bin/code", ...).
    const QString &token() const { return token_; }

private:
    ValidatedCommand(const QString &path, const QString &token) : path_(path), token_(token) {}

    QString path_;
    QString token_;

    friend ValidatedCommand validateCommand(const QString &candidate, const QStringList &systemDirs,
                                            QString *reasonOut);
};

const QSet<QString> &deniedCommands();
const QStringList &deniedCommandPrefixes();
const QSet<QString> &knownSafeEditors();
const QStringList &systemBinaryDirectories();

constexpr qint64 kMaxExecutableBytes = 500LL * 1024 * 1024;

QString commandToken(const QString &candidate);
bool isDeniedCommand(const QString &basename);
bool matchesSafeEditor(const QString &basename, const QString &resolvedPath);

ValidatedCommand validateCommand(const QString &candidate, QString *reasonOut = nullptr);
// Same checks with an explicit set of system binary directories (each ending in '/').
// Absolute tokens inside one of them must be exactly allow-listed by basename.
ValidatedCommand validateCommand(const QString &candidate, const QStringList &systemDirs,
                                 QString *reasonOut = nullptr);

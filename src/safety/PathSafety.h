#pragma once

#include <QString>
#include <QStringList>

// An absolute, symlink-resolved directory that passed validateDirectory().
// Only meaningful at validation time; the filesystem may change afterwards.
class ValidatedPath {
public:
    ValidatedPath() = default;

    bool isValid() const { return !path_.isEmpty(); }
    const QString &path() const { return path_; }

    bool operator==(const ValidatedPath &other) const { return path_ == other.path_; }
    bool operator!=(const ValidatedPath &other) const { return path_ != other.path_; }

private:
    explicit ValidatedPath(const QString &path) : path_(path) {}

    QString path_;

    friend ValidatedPath validateDirectory(const QString &candidate, QString *reasonOut);
};

// Exact-match deny set. Subdirectories are not denied by this list.
const QStringList &forbiddenDirectories();
// Prefix (component-wise) allow set, computed from the current home and temp dirs.
QStringList allowedRoots();

QString expandHome(const QString &candidate);
bool isSameOrSubPath(const QString &path, const QString &root);

ValidatedPath validateDirectory(const QString &candidate, QString *reasonOut = nullptr);

inline bool isUsableDirectory(const QString &candidate) {
    return validateDirectory(candidate).isValid();
}

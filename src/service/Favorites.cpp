#include "service/Favorites.h"

#include "core/Log.h"
#include "safety/PathSafety.h"

#include <QStringList>

bool addFavoriteFolder(SettingsStore &settings, const QString &folder, QString *reasonOut) {
    QString reason;
    const ValidatedPath validated = validateDirectory(folder, &reason);
    if (!validated.isValid()) {
        if (reasonOut) *reasonOut = reason;
        logEvent(QStringLiteral("favorite_rejected: %1 (%2)").arg(folder, reason));
        return false;
    }
    QStringList folders = settings.favoriteFolders();
    if (folders.contains(validated.path())) {
        if (reasonOut) *reasonOut = QStringLiteral("already a favorite");
        return false;
    }
    folders << validated.path();
    if (!settings.setFavoriteFolders(folders)) {
        if (reasonOut) *reasonOut = QStringLiteral("failed to write configuration");
        return false;
    }
    if (reasonOut) reasonOut->clear();
    return true;
}

bool removeFavoriteFolder(SettingsStore &settings, const QString &folder) {
    QStringList folders = settings.favoriteFolders();
    if (folders.removeAll(folder) == 0) return false;
    return settings.setFavoriteFolders(folders);
}

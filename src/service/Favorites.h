#pragma once

#include "core/Settings.h"

#include <QString>

// Pins a folder after it passes validateDirectory(); the canonical path is stored.
// Fails with a reason for rejected folders, duplicates and write errors.
bool addFavoriteFolder(SettingsStore &settings, const QString &folder, QString *reasonOut = nullptr);
// Removes by stored path. Returns false when the folder was not pinned.
bool removeFavoriteFolder(SettingsStore &settings, const QString &folder);

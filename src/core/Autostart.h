#pragma once

#include <QString>

QString autostartFilePath();

bool isAutostartEnabled();
// Writes the login entry for executablePath, which must be an existing absolute file.
bool enableAutostart(const QString &executablePath, QString *reasonOut = nullptr);
// Removing an entry that does not exist succeeds.
bool disableAutostart();

QString desktopEntryExecQuote(const QString &path);

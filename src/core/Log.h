#pragma once

#include <QString>

QString stateDirPath();
QString logFilePath();
QString runtimeDirPath();

bool ensurePrivateDir(const QString &path);

void logEvent(const QString &message);
bool debugEnabled();
void debugLog(const QString &message);

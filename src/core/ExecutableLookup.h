#pragma once

#include <QString>

#include <sys/types.h>

// Search-path lookups are memoized for the process lifetime; PATH is treated as stable.
QString findExecutableCached(const QString &name);
bool hasExecutable(const QString &name);
void clearExecutableCache();

bool isRootOwnedConsideringUserNS(uid_t uid);

// Helper tools must be root-owned regular files under a system prefix and not
// writable by group or others.
bool isExecutableTrustedDetailed(const QString &path, QString *reasonOut);

// Search-path lookup followed by the trust check on the resolved file.
// Empty when the tool is missing or untrusted.
QString findTrustedTool(const QString &name, QString *reasonOut = nullptr);

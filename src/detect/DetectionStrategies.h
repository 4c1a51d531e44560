#pragma once

#include "detect/DesktopTools.h"
#include "detect/EnvironmentProbe.h"

#include <QDeadlineTimer>
#include <QString>

namespace Detection {

constexpr const char *kFileManagerClass = "nautilus";
constexpr const char *kFileManagerService = "org.gnome.Nautilus";
constexpr const char *kFileManagerWindowPath = "/org/gnome/Nautilus/window/1";
constexpr const char *kFileManagerWindowInterface = "org.gnome.Nautilus.Window";
constexpr const char *kLocationProperty = "location";

constexpr int kWindowSearchTimeoutMs = 2000;
constexpr int kFocusedWindowTimeoutMs = 1000;
constexpr int kActiveWindowTimeoutMs = 2000;
constexpr int kWindowNameTimeoutMs = 1000;
constexpr int kWindowPropertyTimeoutMs = 2000;
constexpr int kBusCallTimeoutMs = 2000;

// Caps a per-call timeout by what is left of the strategy deadline.
int boundedTimeout(int timeoutMs, const QDeadlineTimer &deadline);

// Each strategy returns an existing directory or an empty string; failures never escape.
QString fromSessionBus(const EnvironmentSnapshot &env, DesktopTools &tools, const QDeadlineTimer &deadline);
QString fromActiveWindow(const EnvironmentSnapshot &env, DesktopTools &tools, const QDeadlineTimer &deadline);
QString fromWindowProperties(const EnvironmentSnapshot &env, DesktopTools &tools, const QString &windowId,
                             const QDeadlineTimer &deadline);
QString fromFilesystemFallback();

QString directoryFromPropertyText(const QString &text);

}

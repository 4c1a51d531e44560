#pragma once

#include <QString>

enum class DisplayServer {
    X11,
    Wayland
};

QString toString(DisplayServer server);

struct EnvironmentSnapshot {
    DisplayServer displayServer = DisplayServer::X11;
    QString desktop;
    // Tool flags are set only for trusted, root-owned system binaries.
    bool hasWindowQueryTool = false;     // xdotool
    bool hasWindowControlTool = false;   // wmctrl
    bool hasWindowPropertyTool = false;  // xprop
    bool hasSessionBus = false;
};

namespace EnvironmentProbe {

constexpr const char *kWindowQueryTool = "xdotool";
constexpr const char *kWindowControlTool = "wmctrl";
constexpr const char *kWindowPropertyTool = "xprop";

// Cached for the process lifetime after the first call.
EnvironmentSnapshot snapshot();
// Recomputes from the current environment without touching the cache.
EnvironmentSnapshot probe();
// Recomputes and replaces the cached snapshot.
EnvironmentSnapshot refresh();

void logDiagnostics(const EnvironmentSnapshot &env);

}

#pragma once

#include "safety/CommandSafety.h"
#include "safety/PathSafety.h"

#include <QString>

enum class LaunchError {
    None,
    NotFound,
    PermissionDenied,
    Timeout,
    Failed
};

QString toString(LaunchError error);

struct LaunchResult {
    LaunchError error = LaunchError::None;
    qint64 pid = 0;
    QString message;

    bool ok() const { return error == LaunchError::None; }
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    virtual LaunchResult launch(const ValidatedCommand &command, const ValidatedPath &directory) = 0;
};

// Starts the editor detached, in its own session, with null standard streams.
class DetachedProcessLauncher : public ProcessLauncher {
public:
    LaunchResult launch(const ValidatedCommand &command, const ValidatedPath &directory) override;
};

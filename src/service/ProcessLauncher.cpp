#include "service/ProcessLauncher.h"

#include "core/Log.h"
#include "core/ToolRunner.h"

#include <QFileInfo>
#include <QProcess>

QString toString(LaunchError error) {
    switch (error) {
    case LaunchError::None: return QStringLiteral("none");
    case LaunchError::NotFound: return QStringLiteral("not_found");
    case LaunchError::PermissionDenied: return QStringLiteral("permission_denied");
    case LaunchError::Timeout: return QStringLiteral("timeout");
    case LaunchError::Failed: return QStringLiteral("failed");
    }
    return QStringLiteral("failed");
}

LaunchResult DetachedProcessLauncher::launch(const ValidatedCommand &command, const ValidatedPath &directory) {
    LaunchResult result;
    if (!command.isValid() || !directory.isValid()) {
        result.error = LaunchError::Failed;
        result.message = QStringLiteral("unvalidated input");
        return result;
    }
    QProcess p;
    p.setProgram(command.path());
    p.setArguments({directory.path()});
    p.setWorkingDirectory(directory.path());
    p.setProcessEnvironment(safeGuiEnvVars());
    p.setStandardInputFile(QProcess::nullDevice());
    p.setStandardOutputFile(QProcess::nullDevice());
    p.setStandardErrorFile(QProcess::nullDevice());
    qint64 pid = 0;
    if (!p.startDetached(&pid)) {
        const QFileInfo fi(command.path());
        if (!fi.exists()) {
            result.error = LaunchError::NotFound;
        } else if (!fi.isExecutable()) {
            result.error = LaunchError::PermissionDenied;
        } else {
            result.error = LaunchError::Failed;
        }
        result.message = p.errorString();
        logEvent(QStringLiteral("launch_failed: %1 (%2) %3").arg(command.path(), toString(result.error), result.message));
        return result;
    }
    result.pid = pid;
    logEvent(QStringLiteral("launched: %1 -> %2 (pid %3)").arg(command.path(), directory.path()).arg(pid));
    return result;
}

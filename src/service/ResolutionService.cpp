#include "service/ResolutionService.h"

#include "core/Log.h"

#include <QMutexLocker>
#include <QSet>

#include <utility>

QString toString(ResolutionError error) {
    switch (error) {
    case ResolutionError::None: return QStringLiteral("none");
    case ResolutionError::NoDirectoryDetected: return QStringLiteral("no_directory_detected");
    case ResolutionError::NoEditorAvailable: return QStringLiteral("no_editor_available");
    case ResolutionError::FolderRejected: return QStringLiteral("folder_rejected");
    }
    return QStringLiteral("none");
}

ResolutionService::ResolutionService(QVector<DetectionStrategy> strategies)
    : strategies_(std::move(strategies)) {}

ResolutionService::ResolutionService(const EnvironmentSnapshot &env, DesktopTools &tools)
    : strategies_(LocationResolver::defaultStrategies(env, tools)) {}

const QStringList &ResolutionService::fallbackEditors() {
    static const QStringList editors = {
        QStringLiteral("code"),
        QStringLiteral("code-insiders"),
        QStringLiteral("codium"),
        QStringLiteral("vscodium"),
        QStringLiteral("/usr/bin/code"),
        QStringLiteral("/usr/local/bin/code"),
        QStringLiteral("/snap/bin/code"),
        QStringLiteral("/var/lib/flatpak/app/com.visualstudio.code/current/active/export/bin/com.visualstudio.code"),
        QStringLiteral("/opt/visual-studio-code/bin/code"),
        QStringLiteral("~/.local/bin/code")
    };
    return editors;
}

QStringList ResolutionService::editorCandidates(const QString &editorSetting) {
    QStringList candidates;
    QSet<QString> executables;
    const QString configured = editorSetting.trimmed();
    if (!configured.isEmpty()) {
        candidates << configured;
        executables.insert(expandHome(commandToken(configured)));
    }
    for (const QString &editor : fallbackEditors()) {
        const QString expanded = expandHome(editor);
        if (executables.contains(expanded)) continue;
        executables.insert(expanded);
        candidates << expanded;
    }
    return candidates;
}

ValidatedPath ResolutionService::resolveDirectory() {
    LocationResolver resolver(strategies_);
    const ValidatedPath directory = resolver.resolve();
    QMutexLocker locker(&mutex_);
    lastAttempts_ = resolver.attempts();
    if (directory.isValid()) lastDirectory_ = directory.path();
    return directory;
}

Authorization ResolutionService::resolveAndAuthorize(const QString &editorSetting) {
    Authorization auth;
    auth.directory = resolveDirectory();
    if (!auth.directory.isValid()) {
        auth.error = ResolutionError::NoDirectoryDetected;
        return auth;
    }
    const QStringList candidates = editorCandidates(editorSetting);
    for (int i = 0; i < candidates.size(); ++i) {
        QString reason;
        const ValidatedCommand command = validateCommand(candidates.at(i), &reason);
        if (!command.isValid()) {
            debugLog(QStringLiteral("editor_rejected: %1 (%2)").arg(candidates.at(i), reason));
            continue;
        }
        auth.command = command;
        auth.usedFallback = candidates.at(i) != editorSetting.trimmed();
        return auth;
    }
    auth.error = ResolutionError::NoEditorAvailable;
    logEvent(QStringLiteral("editor_unavailable: configured=\"%1\"").arg(editorSetting));
    return auth;
}

OpenResult ResolutionService::openActiveFolder(SettingsStore &settings, ProcessLauncher &launcher) {
    OpenResult result;
    result.directory = resolveDirectory();
    if (!result.directory.isValid()) {
        result.error = ResolutionError::NoDirectoryDetected;
        return result;
    }
    launchFirstEditor(result, settings, launcher);
    return result;
}

OpenResult ResolutionService::openFolder(const QString &folder, SettingsStore &settings, ProcessLauncher &launcher) {
    OpenResult result;
    result.directory = validateDirectory(folder, &result.detail);
    if (!result.directory.isValid()) {
        result.error = ResolutionError::FolderRejected;
        logEvent(QStringLiteral("folder_rejected: %1 (%2)").arg(folder, result.detail));
        return result;
    }
    launchFirstEditor(result, settings, launcher);
    return result;
}

void ResolutionService::launchFirstEditor(OpenResult &result, SettingsStore &settings, ProcessLauncher &launcher) {
    const QString configured = settings.editorCommand().trimmed();
    const QStringList candidates = editorCandidates(configured);
    for (const QString &candidate : candidates) {
        QString reason;
        const ValidatedCommand command = validateCommand(candidate, &reason);
        if (!command.isValid()) {
            if (candidate == configured) logEvent(QStringLiteral("editor_rejected: %1 (%2)").arg(candidate, reason));
            else debugLog(QStringLiteral("editor_rejected: %1 (%2)").arg(candidate, reason));
            continue;
        }
        const LaunchResult launched = launcher.launch(command, result.directory);
        if (!launched.ok()) {
            result.detail = launched.message;
            continue;
        }
        result.command = command;
        result.pid = launched.pid;
        result.detail.clear();
        result.usedFallback = candidate != configured;
        if (result.usedFallback) {
            if (settings.setEditorCommand(candidate)) {
                logEvent(QStringLiteral("editor_fallback_saved: ") + candidate);
            } else {
                logEvent(QStringLiteral("editor_fallback_not_saved: ") + candidate);
            }
        }
        return;
    }
    result.error = ResolutionError::NoEditorAvailable;
    logEvent(QStringLiteral("editor_unavailable: configured=\"%1\"").arg(configured));
}

QString ResolutionService::lastDirectory() const {
    QMutexLocker locker(&mutex_);
    return lastDirectory_;
}

QVector<DetectionAttempt> ResolutionService::lastAttempts() const {
    QMutexLocker locker(&mutex_);
    return lastAttempts_;
}

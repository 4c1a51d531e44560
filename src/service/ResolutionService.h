#pragma once

#include "core/Settings.h"
#include "detect/LocationResolver.h"
#include "safety/CommandSafety.h"
#include "safety/PathSafety.h"
#include "service/ProcessLauncher.h"

#include <QMutex>
#include <QString>
#include <QStringList>
#include <QVector>

enum class ResolutionError {
    None,
    NoDirectoryDetected,
    NoEditorAvailable,
    FolderRejected
};

QString toString(ResolutionError error);

struct Authorization {
    ResolutionError error = ResolutionError::None;
    ValidatedCommand command;
    ValidatedPath directory;
    bool usedFallback = false;

    bool ok() const { return error == ResolutionError::None; }
};

struct OpenResult {
    ResolutionError error = ResolutionError::None;
    ValidatedCommand command;
    ValidatedPath directory;
    qint64 pid = 0;
    bool usedFallback = false;
    // Validator or launcher message behind the last rejection.
    QString detail;

    bool ok() const { return error == ResolutionError::None; }
};

class ResolutionService {
public:
    explicit ResolutionService(QVector<DetectionStrategy> strategies);
    ResolutionService(const EnvironmentSnapshot &env, DesktopTools &tools);

    // Well-known editors tried, in this order, after the configured one.
    static const QStringList &fallbackEditors();
    // The configured setting followed by the fallback list, home-expanded. Entries naming
    // an executable already listed (compared by command token) are dropped.
    static QStringList editorCandidates(const QString &editorSetting);

    ValidatedPath resolveDirectory();
    Authorization resolveAndAuthorize(const QString &editorSetting);
    // Resolves, then launches the first candidate editor that validates and starts.
    // A working fallback is written back to settings.
    OpenResult openActiveFolder(SettingsStore &settings, ProcessLauncher &launcher);
    // Same editor selection for a folder chosen by the user, e.g. a favorite.
    OpenResult openFolder(const QString &folder, SettingsStore &settings, ProcessLauncher &launcher);

    QString lastDirectory() const;
    QVector<DetectionAttempt> lastAttempts() const;

private:
    void launchFirstEditor(OpenResult &result, SettingsStore &settings, ProcessLauncher &launcher);

    QVector<DetectionStrategy> strategies_;
    mutable QMutex mutex_;
    QString lastDirectory_;
    QVector<DetectionAttempt> lastAttempts_;
};

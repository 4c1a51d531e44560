#include <QAction>
#include <QApplication>
#include <QFileDialog>
#include <QFileInfo>
#include <QFutureWatcher>
#include <QIcon>
#include <QInputDialog>
#include <QLineEdit>
#include <QLockFile>
#include <QMenu>
#include <QtConcurrent>
#include <KMessageBox>
#include <KStatusNotifierItem>

#include <functional>

#include "core/ActionGate.h"
#include "core/Autostart.h"
#include "core/Log.h"
#include "core/Settings.h"
#include "detect/DesktopTools.h"
#include "detect/EnvironmentProbe.h"
#include "safety/CommandSafety.h"
#include "service/Favorites.h"
#include "service/ProcessLauncher.h"
#include "service/ResolutionService.h"

namespace {

ActionGate gGate;

// Menu entries whose enabled state follows gGate.
struct TrayActions {
    QAction *open = nullptr;
    QAction *configure = nullptr;
    QMenu *favorites = nullptr;
};

void syncActions(const TrayActions &actions) {
    actions.open->setEnabled(gGate.canOpen());
    actions.configure->setEnabled(gGate.canConfigure());
    actions.favorites->setEnabled(gGate.canConfigure());
}

class ScopedDialogLock {
public:
    explicit ScopedDialogLock(const TrayActions &actions) : actions_(actions) {
        acquired_ = gGate.tryOpenDialog();
        if (acquired_) syncActions(actions_);
    }
    ~ScopedDialogLock() {
        if (!acquired_) return;
        gGate.closeDialog();
        syncActions(actions_);
    }
    bool ok() const { return acquired_; }
private:
    TrayActions actions_;
    bool acquired_{false};
};

void updateToolTip(KStatusNotifierItem &tray, const ResolutionService &service) {
    FileSettingsStore settings;
    tray.setToolTipTitle(QObject::tr("Active Folder"));
    const QString dir = service.lastDirectory();
    if (dir.isEmpty()) {
        tray.setToolTipSubTitle(QObject::tr("Open the focused folder in %1").arg(settings.editorCommand()));
    } else {
        tray.setToolTipSubTitle(QObject::tr("Open in %1:\n%2").arg(settings.editorCommand(), dir));
    }
}

void reportFailure(const OpenResult &result) {
    switch (result.error) {
    case ResolutionError::NoDirectoryDetected:
        KMessageBox::error(nullptr,
                           QObject::tr("No valid folder could be detected.\n"
                                       "Focus a file manager window, or start the tray from a folder you can open."),
                           QObject::tr("No folder detected"));
        break;
    case ResolutionError::NoEditorAvailable:
        KMessageBox::error(nullptr,
                           QObject::tr("No compatible editor was found.\n"
                                       "Install Visual Studio Code or configure a known editor."),
                           QObject::tr("Editor not found"));
        break;
    case ResolutionError::FolderRejected:
        KMessageBox::error(nullptr, QObject::tr("The folder cannot be opened:\n%1").arg(result.detail),
                           QObject::tr("Folder rejected"));
        break;
    case ResolutionError::None:
        break;
    }
}

QString favoriteLabel(const QString &folder) {
    const QString name = QFileInfo(folder).fileName();
    return name.isEmpty() ? folder : name;
}

}

int main(int argc, char **argv) {
    QApplication app(argc, argv);
    QApplication::setApplicationName(QStringLiteral("active-folder-tray"));
    QApplication::setQuitOnLastWindowClosed(false);

    QLockFile lock(runtimeDirPath() + "/active-folder-tray.lock");
    lock.setStaleLockTime(0);
    if (!lock.tryLock(100)) {
        qint64 pid = 0; QString host, appname;
        if (lock.getLockInfo(&pid, &host, &appname)) {
            if (pid > 0) return 0;
        }
        lock.removeStaleLockFile();
        if (!lock.tryLock(100)) return 0;
    }

    logEvent(QStringLiteral("started"));
    const EnvironmentSnapshot env = EnvironmentProbe::snapshot();
    EnvironmentProbe::logDiagnostics(env);

    SystemDesktopTools tools;
    ResolutionService service(env, tools);

    KStatusNotifierItem tray;
    tray.setTitle(QObject::tr("Active Folder"));
    tray.setCategory(KStatusNotifierItem::ApplicationStatus);
    tray.setIconByName(QStringLiteral("folder-open"));
    QMenu *menu = new QMenu();
    TrayActions actions;
    actions.open = menu->addAction(QObject::tr("Open Active Folder"));
    actions.favorites = menu->addMenu(QObject::tr("Favorites"));
    menu->addSeparator();
    actions.configure = menu->addAction(QObject::tr("Configure Editor…"));
    QAction *autostart = menu->addAction(QObject::tr("Start at Login"));
    autostart->setCheckable(true);
    autostart->setChecked(isAutostartEnabled());
    menu->addSeparator();
    QAction *quit = menu->addAction(QObject::tr("Quit"));
    tray.setContextMenu(menu);
    tray.setStandardActionsEnabled(false);

    QFutureWatcher<OpenResult> watcher;
    QObject::connect(&watcher, &QFutureWatcher<OpenResult>::finished, [&watcher, &tray, &service, actions]() {
        const OpenResult result = watcher.result();
        gGate.endDetection();
        syncActions(actions);
        tray.setStatus(KStatusNotifierItem::Active);
        updateToolTip(tray, service);
        if (!result.ok()) {
            logEvent(QStringLiteral("open_failed: ") + toString(result.error));
            reportFailure(result);
        }
    });

    const std::function<void(std::function<OpenResult()>)> startOpen =
        [&watcher, &tray, actions](std::function<OpenResult()> job) {
            if (!gGate.canOpen() || !gGate.tryBeginDetection()) {
                debugLog(QStringLiteral("trigger_ignored: launch in flight or dialog open"));
                return;
            }
            syncActions(actions);
            tray.setStatus(KStatusNotifierItem::NeedsAttention);
            watcher.setFuture(QtConcurrent::run(std::move(job)));
        };

    QObject::connect(actions.open, &QAction::triggered, [&service, startOpen]() {
        startOpen([&service]() {
            FileSettingsStore settings;
            DetachedProcessLauncher launcher;
            return service.openActiveFolder(settings, launcher);
        });
    });

    QObject::connect(&tray, &KStatusNotifierItem::activateRequested, [actions](bool /*active*/, const QPoint & /*pos*/) {
        if (actions.open->isEnabled()) actions.open->trigger();
    });

    QObject::connect(actions.favorites, &QMenu::aboutToShow, [&service, startOpen, actions]() {
        QMenu *favorites = actions.favorites;
        favorites->clear();
        // clear() leaves submenus alive.
        qDeleteAll(favorites->findChildren<QMenu *>(QString(), Qt::FindDirectChildrenOnly));
        FileSettingsStore settings;
        const QStringList folders = settings.favoriteFolders();
        if (folders.isEmpty()) {
            favorites->addAction(QObject::tr("No favorites"))->setEnabled(false);
        }
        for (const QString &folder : folders) {
            QAction *entry = favorites->addAction(QIcon::fromTheme(QStringLiteral("folder")), favoriteLabel(folder));
            entry->setToolTip(folder);
            entry->setEnabled(gGate.canOpen());
            QObject::connect(entry, &QAction::triggered, [&service, startOpen, folder]() {
                startOpen([&service, folder]() {
                    FileSettingsStore store;
                    DetachedProcessLauncher launcher;
                    return service.openFolder(folder, store, launcher);
                });
            });
        }
        favorites->addSeparator();
        QAction *add = favorites->addAction(QObject::tr("Add Folder…"));
        QObject::connect(add, &QAction::triggered, [actions]() {
            ScopedDialogLock dlgLock(actions);
            if (!dlgLock.ok()) return;
            const QString folder = QFileDialog::getExistingDirectory(nullptr, QObject::tr("Select Favorite Folder"));
            if (folder.isEmpty()) return;
            FileSettingsStore store;
            QString reason;
            if (!addFavoriteFolder(store, folder, &reason)) {
                KMessageBox::error(nullptr, QObject::tr("The folder \"%1\" cannot be added:\n%2").arg(folder, reason));
            }
        });
        if (!folders.isEmpty()) {
            QMenu *remove = favorites->addMenu(QObject::tr("Remove Favorite"));
            for (const QString &folder : folders) {
                QAction *entry = remove->addAction(favoriteLabel(folder));
                entry->setToolTip(folder);
                QObject::connect(entry, &QAction::triggered, [folder]() {
                    FileSettingsStore store;
                    if (!removeFavoriteFolder(store, folder)) {
                        KMessageBox::error(nullptr, QObject::tr("Failed to write configuration"));
                    }
                });
            }
        }
    });

    QObject::connect(actions.configure, &QAction::triggered, [&tray, &service, actions]() {
        ScopedDialogLock dlgLock(actions);
        if (!dlgLock.ok()) return;
        FileSettingsStore settings;
        bool ok = false;
        const QString entered = QInputDialog::getText(nullptr, QObject::tr("Configure Editor"),
                                                      QObject::tr("Editor command or absolute path:"),
                                                      QLineEdit::Normal, settings.editorCommand(), &ok).trimmed();
        if (!ok || entered.isEmpty()) return;
        QString reason;
        if (!validateCommand(entered, &reason).isValid()) {
            logEvent(QStringLiteral("editor_setting_rejected: %1 (%2)").arg(entered, reason));
            KMessageBox::error(nullptr, QObject::tr("The editor \"%1\" cannot be used:\n%2").arg(entered, reason));
            return;
        }
        if (!settings.setEditorCommand(entered)) {
            KMessageBox::error(nullptr, QObject::tr("Failed to write configuration"));
            return;
        }
        updateToolTip(tray, service);
    });

    QObject::connect(autostart, &QAction::toggled, [autostart](bool enabled) {
        QString reason;
        const bool ok = enabled ? enableAutostart(QCoreApplication::applicationFilePath(), &reason)
                                : disableAutostart();
        if (ok) return;
        const QSignalBlocker blocker(autostart);
        autostart->setChecked(isAutostartEnabled());
        KMessageBox::error(nullptr, enabled ? QObject::tr("Failed to enable start at login:\n%1").arg(reason)
                                            : QObject::tr("Failed to disable start at login"));
    });

    QObject::connect(quit, &QAction::triggered, &app, &QApplication::quit);

    updateToolTip(tray, service);
    syncActions(actions);
    tray.setStatus(KStatusNotifierItem::Active);
    QApplication::setWindowIcon(QIcon::fromTheme(QStringLiteral("folder-open")));
    const int rc = app.exec();
    if (watcher.isRunning()) watcher.waitForFinished();
    logEvent(QStringLiteral("stopped"));
    return rc;
}

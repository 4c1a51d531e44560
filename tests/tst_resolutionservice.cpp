#include "core/ExecutableLookup.h"
#include "service/ResolutionService.h"

#include "TestSupport.h"

#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QtTest>

#include <memory>

namespace {

QVector<DetectionStrategy> detecting(const QString &dir) {
    return {{QStringLiteral("fixed"), 1000, [dir](const QDeadlineTimer &) { return dir; }}};
}

}

class ResolutionServiceTest : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();

    void candidatesStartWithConfiguredEditor();
    void reportsMissingDirectory();
    void reportsMissingEditor();
    void launchesConfiguredEditor();
    void savesWorkingFallback();
    void continuesAfterLaunchFailure();
    void authorizesWithoutLaunching();
    void remembersLastResolution();
    void configuredCommandWithArgumentsIsTriedOnce();
    void opensFavoriteFolder();
    void rejectsForbiddenFavoriteFolder();

private:
    QString binDir() const { return home_.path() + "/bin"; }
    QString project() const { return home_.path() + "/project"; }
    bool absoluteFallbackInstalled() const;

    QTemporaryDir home_;
    std::unique_ptr<EnvVarGuard> homeGuard_;
    std::unique_ptr<EnvVarGuard> pathGuard_;
};

void ResolutionServiceTest::initTestCase() {
    QVERIFY(home_.isValid());
    homeGuard_.reset(new EnvVarGuard("HOME"));
    pathGuard_.reset(new EnvVarGuard("PATH"));
    qputenv("HOME", QFile::encodeName(home_.path()));
    qputenv("PATH", QFile::encodeName(binDir()));
    QVERIFY(makeDirs(binDir()));
    QVERIFY(makeDirs(project()));
}

void ResolutionServiceTest::init() {
    QFile::remove(binDir() + "/code");
    QFile::remove(binDir() + "/codium");
    clearExecutableCache();
}

bool ResolutionServiceTest::absoluteFallbackInstalled() const {
    for (const QString &editor : ResolutionService::fallbackEditors()) {
        const QString path = expandHome(editor);
        if (path.startsWith('/') && QFileInfo::exists(path)) return true;
    }
    return false;
}

void ResolutionServiceTest::candidatesStartWithConfiguredEditor() {
    const QStringList withVim = ResolutionService::editorCandidates(QStringLiteral(" vim "));
    QCOMPARE(withVim.first(), QStringLiteral("vim"));
    QCOMPARE(withVim.at(1), QStringLiteral("code"));
    QCOMPARE(withVim.size(), ResolutionService::fallbackEditors().size() + 1);
    QCOMPARE(withVim.last(), home_.path() + "/.local/bin/code");

    const QStringList withCode = ResolutionService::editorCandidates(QStringLiteral("code"));
    QCOMPARE(withCode.count(QStringLiteral("code")), 1);
    QCOMPARE(withCode.size(), ResolutionService::fallbackEditors().size());

    QCOMPARE(ResolutionService::editorCandidates(QString()).first(), QStringLiteral("code"));
}

void ResolutionServiceTest::reportsMissingDirectory() {
    ResolutionService service(detecting(QString()));
    MemorySettingsStore settings(QStringLiteral("code"));
    RecordingLauncher launcher;
    const OpenResult result = service.openActiveFolder(settings, launcher);
    QVERIFY(result.error == ResolutionError::NoDirectoryDetected);
    QVERIFY(!result.directory.isValid());
    QVERIFY(launcher.launched.isEmpty());
    QCOMPARE(toString(result.error), QStringLiteral("no_directory_detected"));
}

void ResolutionServiceTest::reportsMissingEditor() {
    if (absoluteFallbackInstalled()) QSKIP("an editor is installed at a fixed fallback location");
    ResolutionService service(detecting(project()));
    MemorySettingsStore settings(QStringLiteral("code"));
    RecordingLauncher launcher;
    const OpenResult result = service.openActiveFolder(settings, launcher);
    QVERIFY(result.error == ResolutionError::NoEditorAvailable);
    QVERIFY(result.directory.isValid());
    QVERIFY(launcher.launched.isEmpty());
    QCOMPARE(settings.writes, 0);
}

void ResolutionServiceTest::launchesConfiguredEditor() {
    QVERIFY(makeScript(binDir() + "/codium"));
    ResolutionService service(detecting(project()));
    MemorySettingsStore settings(QStringLiteral("codium"));
    RecordingLauncher launcher;
    const OpenResult result = service.openActiveFolder(settings, launcher);
    QVERIFY(result.ok());
    QVERIFY(!result.usedFallback);
    QCOMPARE(result.pid, qint64(4242));
    QCOMPARE(launcher.launched, QStringList{QFileInfo(binDir() + "/codium").canonicalFilePath()});
    QCOMPARE(launcher.directories, QStringList{QFileInfo(project()).canonicalFilePath()});
    QCOMPARE(settings.writes, 0);
}

void ResolutionServiceTest::savesWorkingFallback() {
    QVERIFY(makeScript(binDir() + "/codium"));
    ResolutionService service(detecting(project()));
    MemorySettingsStore settings(QStringLiteral("kate"));
    RecordingLauncher launcher;
    const OpenResult result = service.openActiveFolder(settings, launcher);
    QVERIFY(result.ok());
    QVERIFY(result.usedFallback);
    QCOMPARE(result.command.token(), QStringLiteral("codium"));
    QCOMPARE(settings.editorCommand(), QStringLiteral("codium"));
    QCOMPARE(settings.writes, 1);
}

void ResolutionServiceTest::continuesAfterLaunchFailure() {
    QVERIFY(makeScript(binDir() + "/code"));
    QVERIFY(makeScript(binDir() + "/codium"));
    const QString code = QFileInfo(binDir() + "/code").canonicalFilePath();
    const QString codium = QFileInfo(binDir() + "/codium").canonicalFilePath();

    ResolutionService service(detecting(project()));
    MemorySettingsStore settings(QStringLiteral("code"));
    RecordingLauncher launcher;
    launcher.failing << code;
    const OpenResult result = service.openActiveFolder(settings, launcher);
    QVERIFY(result.ok());
    QCOMPARE(launcher.launched, (QStringList{code, codium}));
    QCOMPARE(result.command.path(), codium);
    QCOMPARE(settings.editorCommand(), QStringLiteral("codium"));
}

void ResolutionServiceTest::authorizesWithoutLaunching() {
    QVERIFY(makeScript(binDir() + "/code"));
    ResolutionService service(detecting(project()));
    const Authorization auth = service.resolveAndAuthorize(QStringLiteral("rm -rf"));
    QVERIFY(auth.ok());
    QVERIFY(auth.usedFallback);
    QCOMPARE(auth.command.token(), QStringLiteral("code"));
    QCOMPARE(auth.directory.path(), QFileInfo(project()).canonicalFilePath());

    ResolutionService nothing(detecting(QStringLiteral("/etc")));
    QVERIFY(nothing.resolveAndAuthorize(QStringLiteral("code")).error == ResolutionError::NoDirectoryDetected);
}

void ResolutionServiceTest::remembersLastResolution() {
    ResolutionService service(detecting(project()));
    QVERIFY(service.lastDirectory().isEmpty());
    QVERIFY(service.resolveDirectory().isValid());
    QCOMPARE(service.lastDirectory(), QFileInfo(project()).canonicalFilePath());
    QCOMPARE(service.lastAttempts().size(), 1);
}

void ResolutionServiceTest::configuredCommandWithArgumentsIsTriedOnce() {
    const QStringList candidates = ResolutionService::editorCandidates(QStringLiteral("code --wait"));
    QCOMPARE(candidates.first(), QStringLiteral("code --wait"));
    QVERIFY(!candidates.contains(QStringLiteral("code")));
    QCOMPARE(candidates.size(), ResolutionService::fallbackEditors().size());

    QVERIFY(makeScript(binDir() + "/code"));
    QVERIFY(makeScript(binDir() + "/codium"));
    const QString code = QFileInfo(binDir() + "/code").canonicalFilePath();
    const QString codium = QFileInfo(binDir() + "/codium").canonicalFilePath();
    ResolutionService service(detecting(project()));
    MemorySettingsStore settings(QStringLiteral("code --wait"));
    RecordingLauncher launcher;
    launcher.failing << code;
    const OpenResult result = service.openActiveFolder(settings, launcher);
    QVERIFY(result.ok());
    QCOMPARE(launcher.launched, (QStringList{code, codium}));
}

void ResolutionServiceTest::opensFavoriteFolder() {
    QVERIFY(makeScript(binDir() + "/code"));
    ResolutionService service(detecting(QString()));
    MemorySettingsStore settings(QStringLiteral("code"));
    RecordingLauncher launcher;
    const OpenResult result = service.openFolder(project(), settings, launcher);
    QVERIFY(result.ok());
    QCOMPARE(launcher.directories, QStringList{QFileInfo(project()).canonicalFilePath()});
    QCOMPARE(launcher.launched, QStringList{QFileInfo(binDir() + "/code").canonicalFilePath()});
}

void ResolutionServiceTest::rejectsForbiddenFavoriteFolder() {
    QVERIFY(makeScript(binDir() + "/code"));
    ResolutionService service(detecting(project()));
    MemorySettingsStore settings(QStringLiteral("code"));
    RecordingLauncher launcher;
    const OpenResult result = service.openFolder(QStringLiteral("/etc"), settings, launcher);
    QVERIFY(result.error == ResolutionError::FolderRejected);
    QVERIFY2(result.detail.startsWith(QLatin1String("forbidden system directory")), qPrintable(result.detail));
    QCOMPARE(toString(result.error), QStringLiteral("folder_rejected"));
    QVERIFY(launcher.launched.isEmpty());

    const OpenResult missing = service.openFolder(home_.path() + "/gone", settings, launcher);
    QVERIFY(missing.error == ResolutionError::FolderRejected);
    QCOMPARE(missing.detail, QStringLiteral("does not exist"));
}

QTEST_GUILESS_MAIN(ResolutionServiceTest)
#include "tst_resolutionservice.moc"

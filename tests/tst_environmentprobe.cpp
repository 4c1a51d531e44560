#include "core/ExecutableLookup.h"
#include "detect/EnvironmentProbe.h"

#include "TestSupport.h"

#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QtTest>

#include <memory>

class EnvironmentProbeTest : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();

    void waylandDisplayMeansWayland();
    void sessionTypeMeansWayland();
    void defaultsToX11();
    void ignoresUntrustedToolsOnSearchPath();
    void untrustedToolReasons();
    void acceptsRootOwnedSystemTool();
    void heldSnapshotSurvivesRefresh();
    void detectsSessionBus();
    void snapshotIsCachedUntilRefresh();
    void displayServerNames();

private:
    QTemporaryDir tmp_;
    QVector<std::shared_ptr<EnvVarGuard>> guards_;
};

void EnvironmentProbeTest::initTestCase() {
    QVERIFY(tmp_.isValid());
    for (const char *name : {"PATH", "HOME", "WAYLAND_DISPLAY", "XDG_SESSION_TYPE", "XDG_CURRENT_DESKTOP",
                             "DBUS_SESSION_BUS_ADDRESS", "XDG_RUNTIME_DIR"}) {
        guards_.append(std::make_shared<EnvVarGuard>(name));
    }
    qputenv("HOME", QFile::encodeName(tmp_.path()));
    QVERIFY(makeDirs(tmp_.path() + "/bin"));
    QVERIFY(makeDirs(tmp_.path() + "/runtime"));
}

void EnvironmentProbeTest::init() {
    qunsetenv("WAYLAND_DISPLAY");
    qunsetenv("XDG_SESSION_TYPE");
    qunsetenv("DBUS_SESSION_BUS_ADDRESS");
    qputenv("XDG_RUNTIME_DIR", QFile::encodeName(tmp_.path() + "/runtime"));
    qputenv("PATH", QFile::encodeName(tmp_.path() + "/bin"));
    clearExecutableCache();
}

void EnvironmentProbeTest::waylandDisplayMeansWayland() {
    qputenv("WAYLAND_DISPLAY", "wayland-0");
    QVERIFY(EnvironmentProbe::probe().displayServer == DisplayServer::Wayland);
}

void EnvironmentProbeTest::sessionTypeMeansWayland() {
    qputenv("XDG_SESSION_TYPE", "wayland");
    QVERIFY(EnvironmentProbe::probe().displayServer == DisplayServer::Wayland);
}

void EnvironmentProbeTest::defaultsToX11() {
    qputenv("XDG_SESSION_TYPE", "x11");
    qputenv("XDG_CURRENT_DESKTOP", "GNOME");
    const EnvironmentSnapshot env = EnvironmentProbe::probe();
    QVERIFY(env.displayServer == DisplayServer::X11);
    QCOMPARE(env.desktop, QStringLiteral("gnome"));
}

void EnvironmentProbeTest::ignoresUntrustedToolsOnSearchPath() {
    EnvironmentSnapshot env = EnvironmentProbe::probe();
    QVERIFY(!env.hasWindowQueryTool);
    QVERIFY(!env.hasWindowControlTool);
    QVERIFY(!env.hasWindowPropertyTool);

    // User-writable copies in a home directory must not stand in for the system tools.
    QVERIFY(makeScript(tmp_.path() + "/bin/xdotool"));
    QVERIFY(makeScript(tmp_.path() + "/bin/xprop"));
    clearExecutableCache();
    QVERIFY(hasExecutable(QStringLiteral("xdotool")));
    env = EnvironmentProbe::probe();
    QVERIFY(!env.hasWindowQueryTool);
    QVERIFY(!env.hasWindowControlTool);
    QVERIFY(!env.hasWindowPropertyTool);
    QFile::remove(tmp_.path() + "/bin/xdotool");
    QFile::remove(tmp_.path() + "/bin/xprop");
}

void EnvironmentProbeTest::untrustedToolReasons() {
    QString reason;
    QVERIFY(findTrustedTool(QStringLiteral("xdotool"), &reason).isEmpty());
    QCOMPARE(reason, QStringLiteral("not found"));

    QVERIFY(makeScript(tmp_.path() + "/bin/xdotool"));
    clearExecutableCache();
    QVERIFY(findTrustedTool(QStringLiteral("xdotool"), &reason).isEmpty());
    QVERIFY2(reason == QLatin1String("outside trusted prefix") || reason == QLatin1String("not root-owned"),
             qPrintable(reason));

    const QString target = QFileInfo(QStringLiteral("/bin/sh")).canonicalFilePath();
    if (target.isEmpty()) QSKIP("no /bin/sh to link to");
    QVERIFY(QFile::link(target, tmp_.path() + "/bin/xprop"));
    clearExecutableCache();
    QVERIFY(findTrustedTool(QStringLiteral("xprop"), &reason).isEmpty());
    QCOMPARE(reason, QStringLiteral("symlink not allowed"));

    QFile::remove(tmp_.path() + "/bin/xdotool");
    QFile::remove(tmp_.path() + "/bin/xprop");
}

void EnvironmentProbeTest::acceptsRootOwnedSystemTool() {
    const QString tool = QStringLiteral("/usr/bin/true");
    const QFileInfo fi(tool);
    if (!fi.exists() || fi.isSymLink() || fi.ownerId() != 0) QSKIP("/usr/bin/true is not a root-owned regular file");
    QString reason;
    QVERIFY2(isExecutableTrustedDetailed(tool, &reason), qPrintable(reason));

    qputenv("PATH", "/usr/bin");
    clearExecutableCache();
    QCOMPARE(findTrustedTool(QStringLiteral("true"), &reason), tool);
}

void EnvironmentProbeTest::heldSnapshotSurvivesRefresh() {
    qputenv("XDG_SESSION_TYPE", "x11");
    const EnvironmentSnapshot held = EnvironmentProbe::refresh();
    QVERIFY(held.displayServer == DisplayServer::X11);

    qputenv("WAYLAND_DISPLAY", "wayland-2");
    QVERIFY(EnvironmentProbe::refresh().displayServer == DisplayServer::Wayland);
    QVERIFY(held.displayServer == DisplayServer::X11);
    QVERIFY(EnvironmentProbe::snapshot().displayServer == DisplayServer::Wayland);
}

void EnvironmentProbeTest::detectsSessionBus() {
    QVERIFY(!EnvironmentProbe::probe().hasSessionBus);

    const QString socket = tmp_.path() + "/runtime/bus";
    QVERIFY(writeFile(socket, QByteArray()));
    QVERIFY(EnvironmentProbe::probe().hasSessionBus);
    QFile::remove(socket);

    qputenv("DBUS_SESSION_BUS_ADDRESS", "unix:path=/nonexistent/bus");
    QVERIFY(EnvironmentProbe::probe().hasSessionBus);
}

void EnvironmentProbeTest::snapshotIsCachedUntilRefresh() {
    EnvironmentProbe::refresh();
    QVERIFY(EnvironmentProbe::snapshot().displayServer == DisplayServer::X11);

    qputenv("WAYLAND_DISPLAY", "wayland-1");
    QVERIFY(EnvironmentProbe::snapshot().displayServer == DisplayServer::X11);

    QVERIFY(EnvironmentProbe::refresh().displayServer == DisplayServer::Wayland);
    QVERIFY(EnvironmentProbe::snapshot().displayServer == DisplayServer::Wayland);
}

void EnvironmentProbeTest::displayServerNames() {
    QCOMPARE(toString(DisplayServer::X11), QStringLiteral("x11"));
    QCOMPARE(toString(DisplayServer::Wayland), QStringLiteral("wayland"));
}

QTEST_GUILESS_MAIN(EnvironmentProbeTest)
#include "tst_environmentprobe.moc"

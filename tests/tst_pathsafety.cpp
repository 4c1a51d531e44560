#include "safety/PathSafety.h"

#include "TestSupport.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QtTest>

#include <memory>
#include <unistd.h>

class PathSafetyTest : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    void rejectsForbiddenSystemDirectory();
    void acceptsDirectoryInsideHome();
    void rejectsDirectoryOutsideAllowedRoots();
    void rejectsSymlinkIntoForbiddenDirectory();
    void forbiddenListIsExactMatchOnly();
    void validationIsIdempotent();
    void expandsTilde();
    void trimsSurroundingWhitespace();
    void rejectsEmptyMissingAndFiles();
    void rejectsUnreadableDirectory();
    void subPathComparisonIsComponentWise();
    void allowedRootsNeverContainFilesystemRoot();

private:
    QTemporaryDir home_;
    std::unique_ptr<EnvVarGuard> homeGuard_;
};

void PathSafetyTest::initTestCase() {
    QVERIFY(home_.isValid());
    homeGuard_.reset(new EnvVarGuard("HOME"));
    qputenv("HOME", QFile::encodeName(home_.path()));
}

void PathSafetyTest::rejectsForbiddenSystemDirectory() {
    QString reason;
    const ValidatedPath result = validateDirectory(QStringLiteral("/etc"), &reason);
    QVERIFY(!result.isValid());
    QVERIFY2(reason.startsWith(QLatin1String("forbidden system directory")), qPrintable(reason));
}

void PathSafetyTest::acceptsDirectoryInsideHome() {
    const QString dir = home_.path() + "/projects/app";
    QVERIFY(makeDirs(dir));
    QString reason = QStringLiteral("stale");
    const ValidatedPath result = validateDirectory(dir, &reason);
    QVERIFY(result.isValid());
    QCOMPARE(result.path(), QFileInfo(dir).canonicalFilePath());
    QVERIFY(reason.isEmpty());
}

void PathSafetyTest::rejectsDirectoryOutsideAllowedRoots() {
    if (!QFileInfo(QStringLiteral("/usr/share")).isDir()) QSKIP("/usr/share not present");
    QString reason;
    QVERIFY(!validateDirectory(QStringLiteral("/usr/share"), &reason).isValid());
    QVERIFY2(reason.startsWith(QLatin1String("outside allowed locations")), qPrintable(reason));
}

void PathSafetyTest::rejectsSymlinkIntoForbiddenDirectory() {
    const QString link = home_.path() + "/looks-harmless";
    QVERIFY(QFile::link(QStringLiteral("/etc"), link));
    QString reason;
    QVERIFY(!validateDirectory(link, &reason).isValid());
    QVERIFY2(reason.startsWith(QLatin1String("forbidden system directory")), qPrintable(reason));
}

void PathSafetyTest::forbiddenListIsExactMatchOnly() {
    // Subdirectories of a forbidden entry are only rejected by the allow-list.
    if (!QFileInfo(QStringLiteral("/etc/ssl")).isDir()) QSKIP("/etc/ssl not present");
    const QString real = QFileInfo(QStringLiteral("/etc/ssl")).canonicalFilePath();
    if (!real.startsWith(QLatin1String("/etc/"))) QSKIP("/etc/ssl resolves outside /etc");
    QString reason;
    QVERIFY(!validateDirectory(real, &reason).isValid());
    QVERIFY2(reason.startsWith(QLatin1String("outside allowed locations")), qPrintable(reason));
    QVERIFY(!forbiddenDirectories().contains(real));
}

void PathSafetyTest::validationIsIdempotent() {
    const QString dir = home_.path() + "/idem";
    QVERIFY(makeDirs(dir));
    const ValidatedPath first = validateDirectory(dir);
    QVERIFY(first.isValid());
    const ValidatedPath second = validateDirectory(first.path());
    QVERIFY(second.isValid());
    QCOMPARE(second, first);
}

void PathSafetyTest::expandsTilde() {
    QVERIFY(makeDirs(home_.path() + "/notes"));
    const ValidatedPath result = validateDirectory(QStringLiteral("~/notes"));
    QVERIFY(result.isValid());
    QCOMPARE(result.path(), QFileInfo(home_.path() + "/notes").canonicalFilePath());
    QCOMPARE(validateDirectory(QStringLiteral("~")).path(), QFileInfo(home_.path()).canonicalFilePath());
    QCOMPARE(expandHome(QStringLiteral("~other/x")), QStringLiteral("~other/x"));
}

void PathSafetyTest::trimsSurroundingWhitespace() {
    const QString dir = home_.path() + "/spaced";
    QVERIFY(makeDirs(dir));
    QVERIFY(validateDirectory(QStringLiteral("  ") + dir + QStringLiteral("\n")).isValid());
}

void PathSafetyTest::rejectsEmptyMissingAndFiles() {
    QString reason;
    QVERIFY(!validateDirectory(QStringLiteral("   "), &reason).isValid());
    QCOMPARE(reason, QStringLiteral("empty path"));

    QVERIFY(!validateDirectory(home_.path() + "/missing", &reason).isValid());
    QCOMPARE(reason, QStringLiteral("does not exist"));

    const QString file = home_.path() + "/plain.txt";
    QVERIFY(writeFile(file, "x"));
    QVERIFY(!validateDirectory(file, &reason).isValid());
    QCOMPARE(reason, QStringLiteral("not a directory"));
    QVERIFY(!isUsableDirectory(file));
}

void PathSafetyTest::rejectsUnreadableDirectory() {
    if (::getuid() == 0) QSKIP("root bypasses permission bits");
    const QString dir = home_.path() + "/locked";
    QVERIFY(makeDirs(dir));
    QVERIFY(QFile::setPermissions(dir, QFileDevice::WriteOwner | QFileDevice::ExeOwner));
    QString reason;
    QVERIFY(!validateDirectory(dir, &reason).isValid());
    QCOMPARE(reason, QStringLiteral("not readable"));
    QFile::setPermissions(dir, QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
}

void PathSafetyTest::subPathComparisonIsComponentWise() {
    QVERIFY(isSameOrSubPath(QStringLiteral("/home/a"), QStringLiteral("/home/a")));
    QVERIFY(isSameOrSubPath(QStringLiteral("/home/a/src"), QStringLiteral("/home/a")));
    QVERIFY(!isSameOrSubPath(QStringLiteral("/home/ab"), QStringLiteral("/home/a")));
    QVERIFY(!isSameOrSubPath(QStringLiteral("/home/a"), QString()));
}

void PathSafetyTest::allowedRootsNeverContainFilesystemRoot() {
    const QStringList roots = allowedRoots();
    QVERIFY(!roots.contains(QStringLiteral("/")));
    QVERIFY(roots.contains(QFileInfo(home_.path()).canonicalFilePath()));
    QVERIFY(!validateDirectory(QStringLiteral("/")).isValid());
}

QTEST_GUILESS_MAIN(PathSafetyTest)
#include "tst_pathsafety.moc"

#include "core/ToolRunner.h"

#include "core/Log.h"

#include <QDeadlineTimer>
#include <QDir>
#include <QProcess>

namespace {

const char *const kDangerVars[] = {"LD_PRELOAD", "LD_LIBRARY_PATH", "LD_AUDIT", "LD_ASSUME_KERNEL",
                                   "GCONV_PATH", "HOSTALIASES", "PYTHONPATH", "RUBYLIB", "NODE_PATH",
                                   "PERL5LIB", "DYLD_INSERT_LIBRARIES"};

// SIGKILL cannot be ignored; the reap wait only collects the exit status.
constexpr int kReapMs = 50;

int remainingMs(const QDeadlineTimer &deadline) {
    return static_cast<int>(qMax<qint64>(deadline.remainingTime(), 1));
}

void killAndReap(QProcess &p) {
    p.kill();
    p.waitForFinished(kReapMs);
}

}

QProcessEnvironment toolEnvironment() {
    QProcessEnvironment env;
    env.insert("PATH", "/usr/local/bin:/usr/bin:/bin:/usr/local/sbin:/usr/sbin:/sbin");
    env.insert("LANG", "C");
    env.insert("LC_ALL", "C");
    env.insert("HOME", QDir::homePath());
    static const char *passThrough[] = {"XDG_RUNTIME_DIR", "TMPDIR", "DISPLAY", "XAUTHORITY",
                                        "WAYLAND_DISPLAY", "DBUS_SESSION_BUS_ADDRESS"};
    for (const char *k : passThrough) {
        const QString value = qEnvironmentVariable(k);
        if (!value.isEmpty()) env.insert(QString::fromLatin1(k), value);
    }
    for (const char *k : kDangerVars) env.remove(QString::fromLatin1(k));
    return env;
}

QProcessEnvironment safeGuiEnvVars() {
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    for (const char *k : kDangerVars) env.remove(QString::fromLatin1(k));
    env.remove(QStringLiteral("QT_PLUGIN_PATH"));
    env.remove(QStringLiteral("QT_QPA_PLATFORMTHEME"));
    return env;
}

int runCapture(const QString &program, const QStringList &args, int timeoutMs,
               QString *stdoutOut, QString *stderrOut) {
    if (timeoutMs <= 0) {
        if (stderrOut) *stderrOut = QStringLiteral("timeout");
        debugLog(QStringLiteral("tool_skipped: %1 (no time left)").arg(program));
        return ToolTimedOut;
    }
    // One deadline covers start and completion.
    const QDeadlineTimer deadline(timeoutMs);
    QProcess p;
    p.setProgram(program);
    p.setArguments(args);
    p.setProcessEnvironment(toolEnvironment());
    p.setProcessChannelMode(QProcess::SeparateChannels);
    p.setStandardInputFile(QProcess::nullDevice());
    p.start();
    if (!p.waitForStarted(remainingMs(deadline))) {
        if (p.state() != QProcess::NotRunning) {
            killAndReap(p);
            if (stderrOut) *stderrOut = QStringLiteral("timeout");
            debugLog(QStringLiteral("tool_timeout: %1 did not start within %2ms").arg(program).arg(timeoutMs));
            return ToolTimedOut;
        }
        debugLog(QStringLiteral("tool_start_failed: ") + program);
        return ToolStartFailed;
    }
    if (!p.waitForFinished(remainingMs(deadline))) {
        killAndReap(p);
        if (stderrOut) *stderrOut = QStringLiteral("timeout");
        debugLog(QStringLiteral("tool_timeout: %1 after %2ms").arg(program).arg(timeoutMs));
        return ToolTimedOut;
    }
    if (p.exitStatus() != QProcess::NormalExit) {
        if (stderrOut) *stderrOut = QStringLiteral("crash");
        return ToolCrashed;
    }
    if (stdoutOut) *stdoutOut = QString::fromUtf8(p.readAllStandardOutput());
    if (stderrOut) *stderrOut = QString::fromUtf8(p.readAllStandardError());
    return p.exitCode();
}

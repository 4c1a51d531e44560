#pragma once

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

enum ToolResult {
    ToolStartFailed = -1,
    ToolTimedOut = -2,
    ToolCrashed = -3
};

QProcessEnvironment toolEnvironment();
QProcessEnvironment safeGuiEnvVars();

// Runs program to completion within timeoutMs, start-up included. Returns the exit
// code, or a ToolResult on launch failure, timeout (the child is killed) or crash.
// A non-positive timeout returns ToolTimedOut without starting anything.
int runCapture(const QString &program, const QStringList &args, int timeoutMs,
               QString *stdoutOut, QString *stderrOut = nullptr);

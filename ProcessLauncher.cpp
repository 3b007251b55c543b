// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "ProcessLauncher.h"

#include <QDebug>
#include <QProcess>

bool QProcessLauncher::startDetached(const QString& program, const QStringList& args, QString* errorOut) {
    qint64 pid = 0;
    if (!QProcess::startDetached(program, args, QString(), &pid)) {
        if (errorOut) *errorOut = QStringLiteral("Could not start %1").arg(program);
        return false;
    }

    qDebug() << "ProcessLauncher: started" << program << "pid" << pid;
    return true;
}

bool QProcessLauncher::run(const QString& program, const QStringList& args, int timeoutMs, QString* errorOut) {
    QProcess proc;
    proc.start(program, args);

    if (!proc.waitForStarted()) {
        if (errorOut) *errorOut = QStringLiteral("%1: %2").arg(program, proc.errorString());
        return false;
    }

    if (!proc.waitForFinished(timeoutMs)) {
        proc.kill();
        proc.waitForFinished();
        if (errorOut) *errorOut = QStringLiteral("%1 timed out").arg(program);
        return false;
    }

    if (proc.exitStatus() == QProcess::CrashExit) {
        if (errorOut) *errorOut = QStringLiteral("%1 crashed").arg(program);
        return false;
    }

    if (proc.exitCode() != 0) {
        if (errorOut) {
            const QString stderrText = QString::fromLocal8Bit(proc.readAllStandardError()).trimmed();
            *errorOut = stderrText.isEmpty()
                ? QStringLiteral("%1 failed (exit code %2)").arg(program).arg(proc.exitCode())
                : QStringLiteral("%1 failed (exit code %2): %3").arg(program).arg(proc.exitCode()).arg(stderrText);
        }
        return false;
    }

    return true;
}

// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_PROCESSLAUNCHER_H
#define LINKDECK_PROCESSLAUNCHER_H

#include <QString>
#include <QStringList>

// Starts external programs. Implementations must be usable from any thread.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Fire and forget.
    virtual bool startDetached(const QString& program,
                               const QStringList& args,
                               QString* errorOut = nullptr) = 0;

    // Runs to completion. Success means a normal exit with code 0.
    virtual bool run(const QString& program,
                     const QStringList& args,
                     int timeoutMs,
                     QString* errorOut = nullptr) = 0;
};

class QProcessLauncher final : public ProcessLauncher {
public:
    bool startDetached(const QString& program, const QStringList& args, QString* errorOut = nullptr) override;
    bool run(const QString& program, const QStringList& args, int timeoutMs, QString* errorOut = nullptr) override;
};

#endif //LINKDECK_PROCESSLAUNCHER_H

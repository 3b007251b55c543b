// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_TESTS_FAKEPROCESSLAUNCHER_H
#define LINKDECK_TESTS_FAKEPROCESSLAUNCHER_H

#include "ProcessLauncher.h"

#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>
#include <mutex>

// Records every launch instead of starting anything. Programs listed in
// failing report an error.
class FakeProcessLauncher final : public ProcessLauncher {
public:
    struct Invocation {
        QString program;
        QStringList args;
        bool detached = false;
    };

    bool startDetached(const QString& program, const QStringList& args, QString* errorOut = nullptr) override {
        return record(program, args, true, errorOut);
    }

    bool run(const QString& program, const QStringList& args, int timeoutMs, QString* errorOut = nullptr) override {
        Q_UNUSED(timeoutMs);
        return record(program, args, false, errorOut);
    }

    void setFailing(const QString& program) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failing.insert(program);
    }

    [[nodiscard]] QList<Invocation> invocations() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_invocations;
    }

private:
    bool record(const QString& program, const QStringList& args, bool detached, QString* errorOut) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_invocations.push_back(Invocation{program, args, detached});
        if (m_failing.contains(program)) {
            if (errorOut) *errorOut = QStringLiteral("%1: exited with code 1").arg(program);
            return false;
        }
        return true;
    }

    mutable std::mutex m_mutex;
    QList<Invocation> m_invocations;
    QSet<QString> m_failing;
};

#endif //LINKDECK_TESTS_FAKEPROCESSLAUNCHER_H

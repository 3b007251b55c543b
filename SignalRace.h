// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_SIGNALRACE_H
#define LINKDECK_SIGNALRACE_H

#include "BusConnection.h"

#include <QObject>
#include <QtDBus/QDBusMessage>
#include <functional>
#include <memory>

// Waits for the first of several bus signals that satisfies its source's
// predicate. Non-matching signals are ignored. Once settled, every
// subscription is dropped and settled() fires exactly once. No timeout.
class SignalRace final : public QObject {
    Q_OBJECT

public:
    using Predicate = std::function<bool(const QDBusMessage&)>;

    explicit SignalRace(std::shared_ptr<BusConnection> connection, QObject* parent = nullptr);

    // Returns the source index, or -1 if the subscription failed.
    int addSource(const SignalMatch& match, Predicate predicate, QString* errorOut = nullptr);

    [[nodiscard]] bool isSettled() const { return m_settled; }
    [[nodiscard]] int sourceCount() const { return m_sourceCount; }

signals:
    void settled(int sourceIndex, const QDBusMessage& message);

private:
    void onMessage(int sourceIndex, const Predicate& predicate, const QDBusMessage& message);

    std::shared_ptr<BusConnection> m_connection;
    QObject* m_subscriptions = nullptr;
    int m_sourceCount = 0;
    bool m_settled = false;
};

#endif //LINKDECK_SIGNALRACE_H

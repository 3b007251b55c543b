// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_SMS_CONVERSATIONSIGNALWATCHER_H
#define LINKDECK_SMS_CONVERSATIONSIGNALWATCHER_H

#include "SmsModels.h"

#include <QObject>
#include <QString>

class BusConnectionPool;
class QDBusMessage;

// Turns the daemon's conversationUpdated signals for one device into
// Message events.
//
// The match rule covers the whole conversations interface, since the
// daemon decides the object paths; path and member are checked here.
// Destroying the watcher (or calling start() again) drops the subscription.
class ConversationSignalWatcher final : public QObject {
    Q_OBJECT

public:
    ConversationSignalWatcher(BusConnectionPool* pool, QString deviceId, QObject* parent = nullptr);

    bool start(QString* errorOut = nullptr);
    void stop();

    [[nodiscard]] bool isActive() const { return m_subscription != nullptr; }
    [[nodiscard]] const QString& deviceId() const { return m_deviceId; }

signals:
    void messageReceived(const Message& message);

private:
    void handleSignal(const QDBusMessage& message);

    BusConnectionPool* m_pool = nullptr;
    QString m_deviceId;
    QObject* m_subscription = nullptr;
};

#endif //LINKDECK_SMS_CONVERSATIONSIGNALWATCHER_H

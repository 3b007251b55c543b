// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_NOTIFICATIONACTIONBRIDGE_H
#define LINKDECK_NOTIFICATIONACTIONBRIDGE_H

#include <QObject>
#include <QString>
#include <optional>

class BusConnectionPool;
class ProcessLauncher;
class QDBusMessage;
class SignalRace;

// Shows one desktop notification with an "open" action and, if the user
// picks it, launches a follow-up URL.
//
// After notifyAndAwaitAction() the bridge waits, without timeout, for
// either an "open" ActionInvoked or a NotificationClosed carrying its
// notification id. finished() is emitted once when that happens.
class NotificationActionBridge final : public QObject {
    Q_OBJECT

public:
    struct Options {
        QString appName = QStringLiteral("linkdeck");
        QString icon = QStringLiteral("phone");
        QString openerProgram = QStringLiteral("xdg-open");
        QString fallbackProgram = QStringLiteral("linkdeck-settings");
    };

    NotificationActionBridge(BusConnectionPool* pool,
                             ProcessLauncher* launcher,
                             Options options,
                             QObject* parent = nullptr);

    // False if the notification could not be published or the signals
    // could not be watched; finished() is not emitted in that case.
    bool notifyAndAwaitAction(const QString& summary,
                              const QString& body,
                              const QString& followUpUrl,
                              QString* errorOut = nullptr);

    [[nodiscard]] std::optional<quint32> notificationId() const { return m_notificationId; }
    [[nodiscard]] bool isWaiting() const { return m_race != nullptr; }

    [[nodiscard]] static bool isOpenAction(const QString& actionKey);

signals:
    void finished(quint32 notificationId, bool followUpLaunched);

private:
    void onSettled(int sourceIndex, const QDBusMessage& message);
    bool launchFollowUp();

    BusConnectionPool* m_pool = nullptr;
    ProcessLauncher* m_launcher = nullptr;
    Options m_options;

    std::optional<quint32> m_notificationId;
    QString m_followUpUrl;
    SignalRace* m_race = nullptr;
    int m_actionSource = -1;
};

#endif //LINKDECK_NOTIFICATIONACTIONBRIDGE_H

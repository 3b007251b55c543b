// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "NotificationActionBridge.h"
#include "BusConnectionPool.h"
#include "DaemonProtocol.h"
#include "ProcessLauncher.h"
#include "SignalRace.h"
#include "Utils.h"

#include <QDebug>
#include <QVariantMap>
#include <QtDBus/QDBusMessage>

namespace {
    constexpr const char* kActionDefault = "default";
    constexpr const char* kActionOpen = "open";

    // org.freedesktop.Notifications urgency levels
    constexpr quint8 kUrgencyCritical = 2;

    // Matches a signal whose first argument is our notification id.
    bool carriesId(const QDBusMessage& message, quint32 id) {
        const QVariantList args = message.arguments();
        if (args.isEmpty() || args.first().metaType() != QMetaType::fromType<quint32>())
            return false;
        return args.first().toUInt() == id;
    }
}

NotificationActionBridge::NotificationActionBridge(BusConnectionPool* pool,
                                                   ProcessLauncher* launcher,
                                                   Options options,
                                                   QObject* parent)
    : QObject(parent)
    , m_pool(pool)
    , m_launcher(launcher)
    , m_options(std::move(options)) {}

bool NotificationActionBridge::isOpenAction(const QString& actionKey) {
    return actionKey == QLatin1String(kActionDefault) || actionKey == QLatin1String(kActionOpen);
}

bool NotificationActionBridge::notifyAndAwaitAction(const QString& summary,
                                                    const QString& body,
                                                    const QString& followUpUrl,
                                                    QString* errorOut) {
    if (m_race) {
        if (errorOut) *errorOut = QStringLiteral("notification already pending");
        return false;
    }

    const auto connection = m_pool->acquire(errorOut);
    if (!connection)
        return false;

    QDBusMessage notify = QDBusMessage::createMethodCall(QString::fromLatin1(DaemonProtocol::kNotificationsService),
                                                         QString::fromLatin1(DaemonProtocol::kNotificationsPath),
                                                         QString::fromLatin1(DaemonProtocol::kNotificationsInterface),
                                                         QStringLiteral("Notify"));

    const QStringList actions{
        QString::fromLatin1(kActionDefault), QStringLiteral("Open Settings"),
        QString::fromLatin1(kActionOpen), QStringLiteral("Open"),
    };

    QVariantMap hints;
    hints.insert(QStringLiteral("urgency"), QVariant::fromValue(kUrgencyCritical));
    hints.insert(QStringLiteral("category"), QStringLiteral("device.added"));

    // (s app_name, u replaces_id, s app_icon, s summary, s body, as actions, a{sv} hints, i expire_timeout)
    notify << m_options.appName
           << QVariant::fromValue(quint32(0))
           << m_options.icon
           << summary
           << body
           << actions
           << hints
           << QVariant::fromValue(qint32(0));

    const QDBusMessage reply = connection->call(notify);
    if (reply.type() == QDBusMessage::ErrorMessage) {
        if (errorOut) *errorOut = Utils::formatDbusError(reply.errorName(), reply.errorMessage());
        return false;
    }

    const QVariantList args = reply.arguments();
    if (args.isEmpty() || args.first().metaType() != QMetaType::fromType<quint32>()) {
        if (errorOut) *errorOut = QStringLiteral("Notify(): unexpected reply shape");
        return false;
    }

    const quint32 id = args.first().toUInt();
    m_notificationId = id;
    m_followUpUrl = followUpUrl;
    qInfo() << "Notification: published" << id << summary;

    auto* race = new SignalRace(connection, this);

    SignalMatch actionMatch;
    actionMatch.path = QString::fromLatin1(DaemonProtocol::kNotificationsPath);
    actionMatch.interface = QString::fromLatin1(DaemonProtocol::kNotificationsInterface);
    actionMatch.member = QString::fromLatin1(DaemonProtocol::kActionInvoked);

    SignalMatch closedMatch = actionMatch;
    closedMatch.member = QString::fromLatin1(DaemonProtocol::kNotificationClosed);

    // Other actions on our notification keep the race going.
    auto isOurOpenAction = [id](const QDBusMessage& message) {
        return carriesId(message, id) && isOpenAction(message.arguments().value(1).toString());
    };
    auto isOurClose = [id](const QDBusMessage& message) { return carriesId(message, id); };

    m_actionSource = race->addSource(actionMatch, isOurOpenAction, errorOut);
    const int closedSource = m_actionSource >= 0 ? race->addSource(closedMatch, isOurClose, errorOut) : -1;
    if (m_actionSource < 0 || closedSource < 0) {
        qWarning() << "Notification: cannot watch signals for" << id;
        delete race;
        m_actionSource = -1;
        return false;
    }

    connect(race, &SignalRace::settled, this, &NotificationActionBridge::onSettled);
    m_race = race;
    return true;
}

void NotificationActionBridge::onSettled(int sourceIndex, const QDBusMessage& message) {
    const quint32 id = m_notificationId.value_or(0);
    m_race->deleteLater();
    m_race = nullptr;

    bool launched = false;
    if (sourceIndex == m_actionSource) {
        qInfo() << "Notification:" << id << "action" << message.arguments().value(1).toString();
        launched = launchFollowUp();
    } else {
        const quint32 reason = message.arguments().value(1).toUInt();
        qDebug() << "Notification:" << id << "closed, reason" << reason;
    }

    Q_EMIT finished(id, launched);
}

bool NotificationActionBridge::launchFollowUp() {
    if (!m_launcher) {
        qWarning() << "Notification: no launcher for" << m_followUpUrl;
        return false;
    }

    QString err;
    if (m_launcher->startDetached(m_options.openerProgram, {m_followUpUrl}, &err))
        return true;
    qWarning().noquote() << "Notification:" << m_options.openerProgram << "failed -" << err;

    err.clear();
    if (m_launcher->startDetached(m_options.fallbackProgram, {m_followUpUrl}, &err))
        return true;
    qWarning().noquote() << "Notification:" << m_options.fallbackProgram << "failed -" << err;
    return false;
}

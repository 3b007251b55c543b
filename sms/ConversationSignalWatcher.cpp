// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "ConversationSignalWatcher.h"
#include "SmsPayload.h"

#include "BusConnectionPool.h"
#include "DaemonProtocol.h"
#include "Utils.h"

#include <QDebug>
#include <QtDBus/QDBusMessage>

ConversationSignalWatcher::ConversationSignalWatcher(BusConnectionPool* pool, QString deviceId, QObject* parent)
    : QObject(parent)
    , m_pool(pool)
    , m_deviceId(std::move(deviceId)) {}

bool ConversationSignalWatcher::start(QString* errorOut) {
    stop();

    const auto connection = m_pool->acquire(errorOut);
    if (!connection)
        return false;

    auto* subscription = new QObject(this);

    SignalMatch match;
    match.service = QString::fromLatin1(DaemonProtocol::kService);
    match.interface = QString::fromLatin1(DaemonProtocol::kConversationsInterface);

    const bool ok = connection->subscribe(match, subscription, [this, subscription](const QDBusMessage& message) {
        // Late deliveries for a subscription that was already replaced.
        if (m_subscription != subscription)
            return;
        handleSignal(message);
    }, errorOut);

    if (!ok) {
        delete subscription;
        qWarning() << "Conversations: could not subscribe for" << m_deviceId;
        return false;
    }

    m_subscription = subscription;
    qInfo() << "Conversations: listening for" << m_deviceId;
    return true;
}

void ConversationSignalWatcher::stop() {
    if (!m_subscription)
        return;

    // A signal may be in flight through this object right now.
    m_subscription->deleteLater();
    m_subscription = nullptr;
    qDebug() << "Conversations: stopped listening for" << m_deviceId;
}

void ConversationSignalWatcher::handleSignal(const QDBusMessage& message) {
    if (!message.path().contains(m_deviceId))
        return;
    if (message.member() != QLatin1String(DaemonProtocol::kConversationUpdated))
        return;

    const QVariantList args = message.arguments();
    if (args.isEmpty()) {
        qDebug() << "Conversations: empty conversationUpdated for" << m_deviceId;
        return;
    }

    const std::optional<Message> decoded = SmsPayload::messageFromSignalArgument(args.first(), Utils::nowMillis());
    if (!decoded) {
        qDebug() << "Conversations: conversationUpdated payload is not a message structure";
        return;
    }

    qDebug() << "Conversations: message" << decoded->id << "in thread" << decoded->threadId;
    Q_EMIT messageReceived(*decoded);
}

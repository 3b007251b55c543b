// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "SignalRace.h"

#include <QDebug>

SignalRace::SignalRace(std::shared_ptr<BusConnection> connection, QObject* parent)
    : QObject(parent)
    , m_connection(std::move(connection)) {
    m_subscriptions = new QObject(this);
}

int SignalRace::addSource(const SignalMatch& match, Predicate predicate, QString* errorOut) {
    if (m_settled || !m_subscriptions) {
        if (errorOut) *errorOut = QStringLiteral("race already settled");
        return -1;
    }
    if (!m_connection) {
        if (errorOut) *errorOut = QStringLiteral("no bus connection");
        return -1;
    }

    const int index = m_sourceCount;
    const bool ok = m_connection->subscribe(match, m_subscriptions,
        [this, index, predicate = std::move(predicate)](const QDBusMessage& message) {
            onMessage(index, predicate, message);
        }, errorOut);

    if (!ok)
        return -1;

    ++m_sourceCount;
    return index;
}

void SignalRace::onMessage(int sourceIndex, const Predicate& predicate, const QDBusMessage& message) {
    if (m_settled)
        return;
    if (predicate && !predicate(message))
        return;

    m_settled = true;

    // We are inside a handler owned by this object; let Qt delete it later.
    m_subscriptions->deleteLater();
    m_subscriptions = nullptr;

    qDebug() << "SignalRace: settled by source" << sourceIndex << message.member();
    Q_EMIT settled(sourceIndex, message);
}

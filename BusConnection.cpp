// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "BusConnection.h"
#include "Utils.h"

#include <QDebug>
#include <QtDBus/QDBusError>

#include <atomic>

namespace {
    std::atomic<quint32> g_connectionCounter{0};
}

std::shared_ptr<BusConnection> DbusSessionConnection::open(QString* errorOut) {
    const QString name = QStringLiteral("linkdeck-session-%1").arg(g_connectionCounter.fetch_add(1));

    QDBusConnection connection = QDBusConnection::connectToBus(QDBusConnection::SessionBus, name);
    if (!connection.isConnected()) {
        const QDBusError e = connection.lastError();
        if (errorOut) {
            *errorOut = e.isValid()
                ? Utils::formatDbusError(e.name(), e.message())
                : QStringLiteral("Could not connect to the session bus.");
        }
        QDBusConnection::disconnectFromBus(name);
        return nullptr;
    }

    qDebug() << "BusConnection: opened session connection" << name << "unique name" << connection.baseService();
    return std::shared_ptr<BusConnection>(new DbusSessionConnection(connection));
}

DbusSessionConnection::DbusSessionConnection(const QDBusConnection& connection)
    : m_connection(connection) {}

DbusSessionConnection::~DbusSessionConnection() {
    qDebug() << "BusConnection: closing session connection" << m_connection.name();
    QDBusConnection::disconnectFromBus(m_connection.name());
}

bool DbusSessionConnection::isConnected() const {
    return m_connection.isConnected();
}

QDBusMessage DbusSessionConnection::call(const QDBusMessage& message, int timeoutMs) {
    return m_connection.call(message, QDBus::Block, timeoutMs);
}

bool DbusSessionConnection::subscribe(const SignalMatch& match,
                                      QObject* context,
                                      SignalHandler handler,
                                      QString* errorOut) {
    if (!context) {
        if (errorOut) *errorOut = QStringLiteral("subscribe(): no context object");
        return false;
    }

    auto* relay = new SignalRelay(std::move(handler), context);
    const bool ok = m_connection.connect(match.service,
                                         match.path,
                                         match.interface,
                                         match.member,
                                         relay,
                                         SLOT(onMessage(QDBusMessage)));
    if (!ok) {
        if (errorOut) {
            const QDBusError e = m_connection.lastError();
            *errorOut = e.isValid()
                ? Utils::formatDbusError(e.name(), e.message())
                : QStringLiteral("Could not add match rule for %1.%2").arg(match.interface, match.member);
        }
        delete relay;
        return false;
    }

    return true;
}

SignalRelay::SignalRelay(SignalHandler handler, QObject* parent)
    : QObject(parent)
    , m_handler(std::move(handler)) {}

void SignalRelay::onMessage(const QDBusMessage& message) {
    if (m_handler)
        m_handler(message);
}

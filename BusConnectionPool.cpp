// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "BusConnectionPool.h"

#include <QDebug>

BusConnectionPool::BusConnectionPool()
    : BusConnectionPool([](QString* errorOut) { return DbusSessionConnection::open(errorOut); }) {}

BusConnectionPool::BusConnectionPool(Factory factory)
    : m_factory(std::move(factory)) {}

std::shared_ptr<BusConnection> BusConnectionPool::acquire(QString* errorOut) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_connection)
            return m_connection;
    }

    QString err;
    std::shared_ptr<BusConnection> fresh = m_factory ? m_factory(&err) : nullptr;
    if (!fresh) {
        if (err.isEmpty())
            err = QStringLiteral("Session bus connection could not be created.");
        qWarning().noquote() << "BusConnectionPool: connect failed:" << err;
        if (errorOut) *errorOut = err;
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_connection)
        qDebug() << "BusConnectionPool: replacing a connection cached by a concurrent acquire()";
    m_connection = fresh;
    qDebug() << "BusConnectionPool: cached new session connection";
    return fresh;
}

void BusConnectionPool::cleanup() {
    std::shared_ptr<BusConnection> released;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        released.swap(m_connection);
    }

    if (released) {
        qInfo() << "BusConnectionPool: released cached session connection";
    } else {
        qDebug() << "BusConnectionPool: cleanup() with nothing cached";
    }
}

bool BusConnectionPool::hasConnection() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connection != nullptr;
}

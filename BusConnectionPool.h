// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_BUSCONNECTIONPOOL_H
#define LINKDECK_BUSCONNECTIONPOOL_H

#include "BusConnection.h"

#include <QString>
#include <functional>
#include <memory>
#include <mutex>

// Process-wide holder of one shared session-bus connection.
//
// acquire() opens the connection lazily on first use and returns the same
// object afterwards. The lock is only held to read or store the cached
// handle, never while connecting. Two threads that both find the cache
// empty will both connect; the later store replaces the earlier one, which
// stays valid for whoever already holds it and is released when dropped.
class BusConnectionPool {
public:
    using Factory = std::function<std::shared_ptr<BusConnection>(QString* errorOut)>;

    // Opens real session connections.
    BusConnectionPool();
    explicit BusConnectionPool(Factory factory);

    BusConnectionPool(const BusConnectionPool&) = delete;
    BusConnectionPool& operator=(const BusConnectionPool&) = delete;

    std::shared_ptr<BusConnection> acquire(QString* errorOut = nullptr);

    // Drops the cached connection. Safe to call any number of times;
    // a later acquire() reconnects.
    void cleanup();

    [[nodiscard]] bool hasConnection() const;

private:
    Factory m_factory;

    mutable std::mutex m_mutex;
    std::shared_ptr<BusConnection> m_connection;
};

#endif //LINKDECK_BUSCONNECTIONPOOL_H

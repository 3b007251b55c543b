// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "DeviceRegistry.h"
#include "DeviceStateMerger.h"

#include <QDebug>
#include <QFutureWatcher>
#include <QtConcurrent/QtConcurrentRun>

DeviceRegistry::DeviceRegistry(const DaemonClient* client, int refreshIntervalMs, QObject* parent)
    : QObject(parent)
    , m_fetcher(client) {
    m_timer = new QTimer(this);
    m_timer->setInterval(refreshIntervalMs);
    connect(m_timer, &QTimer::timeout, this, &DeviceRegistry::refresh);
}

std::optional<Device> DeviceRegistry::device(const QString& deviceId) const {
    const auto it = m_devices.constFind(deviceId);
    if (it == m_devices.cend())
        return std::nullopt;
    return *it;
}

void DeviceRegistry::start() {
    m_stopped = false;
    m_timer->start();
    refresh();
}

void DeviceRegistry::stop() {
    m_stopped = true;
    m_refreshPending = false;
    m_timer->stop();
}

void DeviceRegistry::refresh() {
    if (m_stopped)
        return;
    if (m_refreshInFlight) {
        m_refreshPending = true;
        return;
    }
    m_refreshInFlight = true;

    auto* watcher = new QFutureWatcher<QList<Device>>(this);
    connect(watcher, &QFutureWatcher<QList<Device>>::finished, this, [this, watcher]() {
        watcher->deleteLater();
        m_refreshInFlight = false;

        const QList<Device> fresh = watcher->result();
        applySnapshot(fresh);
        Q_EMIT refreshFinished(static_cast<int>(fresh.size()));

        if (m_refreshPending) {
            m_refreshPending = false;
            refresh();
        }
    });

    // The fetcher is a thin handle; copy it so the job never touches this object.
    const DeviceSnapshotFetcher fetcher = m_fetcher;
    watcher->setFuture(QtConcurrent::run([fetcher]() { return fetcher.fetchDevices(); }));
}

void DeviceRegistry::applySnapshot(const QList<Device>& fresh) {
    m_devices = DeviceStateMerger::merge(m_devices, fresh);
    qDebug() << "DeviceRegistry: snapshot applied," << m_devices.size() << "device(s)";
    Q_EMIT devicesChanged();
}

void DeviceRegistry::setAvailablePlayers(const QString& deviceId, const QStringList& players) {
    auto it = m_devices.find(deviceId);
    if (it == m_devices.end())
        return;

    it->availablePlayers = players;
    Q_EMIT devicesChanged();
}

void DeviceRegistry::setMediaInfo(const QString& deviceId, const MediaPlayerInfo& info) {
    auto it = m_devices.find(deviceId);
    if (it == m_devices.end())
        return;

    if (!info.player.isEmpty())
        it->currentPlayer = info.player;
    it->mediaInfo = info;
    Q_EMIT devicesChanged();
}

// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_DEVICEREGISTRY_H
#define LINKDECK_DEVICEREGISTRY_H

#include "Device.h"
#include "DeviceSnapshotFetcher.h"

#include <QObject>
#include <QTimer>
#include <optional>

class DaemonClient;

// Owns the merged device map the UI reads from.
//
// Snapshots are fetched on a worker thread and merged on the registry's
// thread, so the map is only ever touched from one thread.
class DeviceRegistry final : public QObject {
    Q_OBJECT

public:
    explicit DeviceRegistry(const DaemonClient* client, int refreshIntervalMs = 5000, QObject* parent = nullptr);

    [[nodiscard]] DeviceMap devices() const { return m_devices; }
    [[nodiscard]] std::optional<Device> device(const QString& deviceId) const;
    [[nodiscard]] bool isRefreshing() const { return m_refreshInFlight; }

    // Starts the periodic refresh and runs one right away.
    void start();
    // Also rejects further refresh() calls until the next start().
    void stop();

    void applySnapshot(const QList<Device>& fresh);

    // Session-only updates. Unknown device ids are ignored.
    void setAvailablePlayers(const QString& deviceId, const QStringList& players);
    void setMediaInfo(const QString& deviceId, const MediaPlayerInfo& info);

public slots:
    // Coalesces: a refresh requested while one is running starts right after it.
    void refresh();

signals:
    void devicesChanged();
    void refreshFinished(int deviceCount);

private:
    DeviceSnapshotFetcher m_fetcher;
    QTimer* m_timer = nullptr;

    DeviceMap m_devices;
    bool m_refreshInFlight = false;
    bool m_refreshPending = false;
    bool m_stopped = false;
};

#endif //LINKDECK_DEVICEREGISTRY_H

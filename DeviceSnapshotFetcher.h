// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_DEVICESNAPSHOTFETCHER_H
#define LINKDECK_DEVICESNAPSHOTFETCHER_H

#include "Device.h"

#include <QList>
#include <QString>

class DaemonClient;

// Builds a fresh picture of every device the daemon knows about.
//
// Devices are fetched concurrently. A failing property read only leaves
// that field at its default (name "Unknown", type "phone", flags false,
// optional readings absent). Session fields (players, media info) are
// never filled here.
class DeviceSnapshotFetcher {
public:
    explicit DeviceSnapshotFetcher(const DaemonClient* client);

    // Empty when the daemon is unreachable.
    [[nodiscard]] QList<Device> fetchDevices() const;

    [[nodiscard]] Device fetchDevice(const QString& deviceId) const;

private:
    void fetchPlugins(Device& d) const;
    void fetchBattery(Device& d) const;
    void fetchConnectivity(Device& d) const;

    const DaemonClient* m_client = nullptr;
};

#endif //LINKDECK_DEVICESNAPSHOTFETCHER_H

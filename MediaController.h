// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_MEDIACONTROLLER_H
#define LINKDECK_MEDIACONTROLLER_H

#include "DaemonClient.h"
#include "Device.h"

#include <QObject>
#include <QString>
#include <QStringList>
#include <optional>

class DeviceRegistry;

// Remote media playback on a device, through the mprisremote plugin.
class MediaController final : public QObject {
    Q_OBJECT

public:
    static constexpr qint32 kVolumeStep = 10;

    MediaController(const DaemonClient* client, DeviceRegistry* registry, QObject* parent = nullptr);

    static std::optional<QStringList> fetchPlayers(const DaemonClient& client,
                                                   const QString& deviceId,
                                                   QString* errorOut = nullptr);

    // Every field that cannot be read keeps its MediaPlayerInfo default.
    static MediaPlayerInfo fetchPlayerInfo(const DaemonClient& client, const QString& deviceId);

    // Fetches players and player info off-thread and stores them in the
    // registry. Devices without a usable media plugin are skipped.
    void loadSession(const QString& deviceId);

    bool selectPlayer(const QString& deviceId, const QString& player, QString* errorOut = nullptr);
    bool sendAction(const QString& deviceId, DaemonClient::MediaAction action, QString* errorOut = nullptr);
    bool setVolume(const QString& deviceId, qint32 volume, QString* errorOut = nullptr);

    // Relative to the last known volume (50 when nothing is known yet).
    bool stepVolume(const QString& deviceId, qint32 delta, QString* errorOut = nullptr);

signals:
    void sessionLoaded(const QString& deviceId);

private:
    struct Session {
        QStringList players;
        MediaPlayerInfo info;
    };

    const DaemonClient* m_client = nullptr;
    DeviceRegistry* m_registry = nullptr;
};

#endif //LINKDECK_MEDIACONTROLLER_H

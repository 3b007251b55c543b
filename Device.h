// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_DEVICE_H
#define LINKDECK_DEVICE_H

#include <QHash>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <optional>

struct MediaPlayerInfo {
    QString player;
    QString title;
    QString artist;
    QString album;
    bool isPlaying = false;
    qint64 length = 0;
    qint64 position = 0;
    qint32 volume = 50;
    bool canPause = true;
    bool canPlay = true;
    bool canGoNext = true;
    bool canGoPrevious = true;
    bool canSeek = false;
};

struct Device {
    QString id;
    QString name;
    QString type;
    bool isReachable = false;
    bool isPaired = false;
    qint32 pairingRequests = 0;

    std::optional<qint32> batteryLevel;
    std::optional<bool> isCharging;
    std::optional<qint32> signalStrength;
    std::optional<QString> networkType;

    bool hasBattery = false;
    bool hasPing = false;
    bool hasShare = false;
    bool hasFindMyPhone = false;
    bool hasSms = false;
    bool hasClipboard = false;
    bool hasContacts = false;
    bool hasMpris = false;
    bool hasRemoteKeyboard = false;
    bool hasSftp = false;
    bool hasPresenter = false;
    bool hasLockDevice = false;
    bool hasVirtualMonitor = false;
    bool hasConnectivityReport = false;
    bool hasNotifications = false;

    // Session state. Never filled by a snapshot; carried across by the merger.
    QStringList availablePlayers;
    std::optional<QString> currentPlayer;
    std::optional<MediaPlayerInfo> mediaInfo;

    [[nodiscard]] bool isConnected() const { return isReachable && isPaired; }
    [[nodiscard]] bool supportsMedia() const { return hasMpris && isConnected(); }
};

using DeviceMap = QHash<QString, Device>;

// Values of the daemon's pairStateChanged(int) argument.
enum class PairState : qint32 {
    NotPaired = 0,
    RequestedByUs = 1,
    RequestedByPeer = 2,
    Paired = 3,
};

struct PairingNotification {
    QString deviceId;
    QString deviceName;
    QString deviceType;
};

Q_DECLARE_METATYPE(MediaPlayerInfo)
Q_DECLARE_METATYPE(Device)
Q_DECLARE_METATYPE(PairingNotification)

#endif //LINKDECK_DEVICE_H

// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "DeviceSnapshotFetcher.h"
#include "DaemonClient.h"
#include "DaemonProtocol.h"

#include <QDebug>

#include <algorithm>
#include <vector>

// TBB and Qt both want 'emit'.
#ifdef emit
#define QT_EMIT_BACKUP emit
#undef emit
#endif

#include <execution>

#ifdef QT_EMIT_BACKUP
#define emit QT_EMIT_BACKUP
#undef QT_EMIT_BACKUP
#endif

namespace {
    struct PluginFlag {
        const char* pluginId;
        bool Device::*flag;
    };

    constexpr PluginFlag kPluginFlags[] = {
        {DaemonProtocol::kPluginBattery, &Device::hasBattery},
        {DaemonProtocol::kPluginPing, &Device::hasPing},
        {DaemonProtocol::kPluginShare, &Device::hasShare},
        {DaemonProtocol::kPluginFindMyPhone, &Device::hasFindMyPhone},
        {DaemonProtocol::kPluginSms, &Device::hasSms},
        {DaemonProtocol::kPluginClipboard, &Device::hasClipboard},
        {DaemonProtocol::kPluginContacts, &Device::hasContacts},
        {DaemonProtocol::kPluginMpris, &Device::hasMpris},
        {DaemonProtocol::kPluginRemoteKeyboard, &Device::hasRemoteKeyboard},
        {DaemonProtocol::kPluginSftp, &Device::hasSftp},
        {DaemonProtocol::kPluginPresenter, &Device::hasPresenter},
        {DaemonProtocol::kPluginLockDevice, &Device::hasLockDevice},
        {DaemonProtocol::kPluginVirtualMonitor, &Device::hasVirtualMonitor},
        {DaemonProtocol::kPluginConnectivity, &Device::hasConnectivityReport},
        {DaemonProtocol::kPluginNotifications, &Device::hasNotifications},
    };
}

DeviceSnapshotFetcher::DeviceSnapshotFetcher(const DaemonClient* client)
    : m_client(client) {}

QList<Device> DeviceSnapshotFetcher::fetchDevices() const {
    QString err;
    const std::optional<QStringList> ids = m_client->deviceIds(false, false, &err);
    if (!ids) {
        qWarning().noquote() << "DeviceSnapshotFetcher: cannot list devices:" << err;
        return {};
    }

    const std::vector<QString> work(ids->cbegin(), ids->cend());
    std::vector<Device> fetched(work.size());

    std::transform(std::execution::par, work.begin(), work.end(), fetched.begin(), [this](const QString& id) {
        return fetchDevice(id);
    });

    QList<Device> out;
    out.reserve(static_cast<qsizetype>(fetched.size()));
    for (Device& d : fetched) {
        out.push_back(std::move(d));
    }
    return out;
}

Device DeviceSnapshotFetcher::fetchDevice(const QString& deviceId) const {
    Device d;
    d.id = deviceId;

    QString err;
    d.name = m_client->deviceString(deviceId, QStringLiteral("name"), &err).value_or(QString());
    if (d.name.isEmpty()) {
        if (!err.isEmpty())
            qDebug().noquote() << "DeviceSnapshotFetcher:" << deviceId << "has no name -" << err;
        d.name = QStringLiteral("Unknown");
    }

    d.isReachable = m_client->deviceBool(deviceId, QStringLiteral("isReachable")).value_or(false);
    d.isPaired = m_client->deviceBool(deviceId, QStringLiteral("isPaired")).value_or(false);
    d.type = m_client->deviceString(deviceId, QStringLiteral("type")).value_or(QString());
    if (d.type.isEmpty())
        d.type = QStringLiteral("phone");
    d.pairingRequests = m_client->deviceInt(deviceId, QStringLiteral("pairingRequestsCount")).value_or(0);

    fetchPlugins(d);

    if (d.hasBattery)
        fetchBattery(d);
    if (d.hasConnectivityReport)
        fetchConnectivity(d);

    return d;
}

void DeviceSnapshotFetcher::fetchPlugins(Device& d) const {
    for (const PluginFlag& p : kPluginFlags) {
        d.*(p.flag) = m_client->hasPlugin(d.id, QString::fromLatin1(p.pluginId)).value_or(false);
    }
}

void DeviceSnapshotFetcher::fetchBattery(Device& d) const {
    const QString path = QString::fromLatin1(DaemonProtocol::kBatteryPath);
    const QString iface = QString::fromLatin1(DaemonProtocol::kBatteryInterface);

    d.batteryLevel = m_client->pluginInt(d.id, path, iface, QStringLiteral("charge"));
    d.isCharging = m_client->pluginBool(d.id, path, iface, QStringLiteral("isCharging"));
}

void DeviceSnapshotFetcher::fetchConnectivity(Device& d) const {
    const QString path = QString::fromLatin1(DaemonProtocol::kConnectivityPath);
    const QString iface = QString::fromLatin1(DaemonProtocol::kConnectivityInterface);

    d.signalStrength = m_client->pluginInt(d.id, path, iface, QStringLiteral("cellularNetworkStrength"));
    d.networkType = m_client->pluginString(d.id, path, iface, QStringLiteral("cellularNetworkType"));
}

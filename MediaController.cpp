// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "MediaController.h"
#include "DaemonProtocol.h"
#include "DeviceRegistry.h"

#include <QDebug>
#include <QFutureWatcher>
#include <QPointer>
#include <QtConcurrent/QtConcurrentRun>

#include <algorithm>

namespace {
    QString mprisPath() {
        return QString::fromLatin1(DaemonProtocol::kMprisPath);
    }

    QString mprisInterface() {
        return QString::fromLatin1(DaemonProtocol::kMprisInterface);
    }
}

MediaController::MediaController(const DaemonClient* client, DeviceRegistry* registry, QObject* parent)
    : QObject(parent)
    , m_client(client)
    , m_registry(registry) {}

std::optional<QStringList> MediaController::fetchPlayers(const DaemonClient& client,
                                                         const QString& deviceId,
                                                         QString* errorOut) {
    return client.pluginStringList(deviceId, mprisPath(), mprisInterface(), QStringLiteral("playerList"), errorOut);
}

MediaPlayerInfo MediaController::fetchPlayerInfo(const DaemonClient& client, const QString& deviceId) {
    const QString path = mprisPath();
    const QString iface = mprisInterface();
    const MediaPlayerInfo defaults;

    auto str = [&](const char* name, const QString& fallback) {
        return client.pluginString(deviceId, path, iface, QString::fromLatin1(name)).value_or(fallback);
    };
    auto flag = [&](const char* name, bool fallback) {
        return client.pluginBool(deviceId, path, iface, QString::fromLatin1(name)).value_or(fallback);
    };

    MediaPlayerInfo info;
    info.player = str("player", defaults.player);
    info.title = str("title", defaults.title);
    info.artist = str("artist", defaults.artist);
    info.album = str("album", defaults.album);
    info.isPlaying = flag("isPlaying", defaults.isPlaying);
    info.length = client.pluginInt64(deviceId, path, iface, QStringLiteral("length")).value_or(defaults.length);
    info.position = client.pluginInt64(deviceId, path, iface, QStringLiteral("position")).value_or(defaults.position);
    info.volume = client.pluginInt(deviceId, path, iface, QStringLiteral("volume")).value_or(defaults.volume);
    info.canPause = flag("canPause", defaults.canPause);
    info.canPlay = flag("canPlay", defaults.canPlay);
    info.canGoNext = flag("canGoNext", defaults.canGoNext);
    info.canGoPrevious = flag("canGoPrevious", defaults.canGoPrevious);
    info.canSeek = flag("canSeek", defaults.canSeek);
    return info;
}

void MediaController::loadSession(const QString& deviceId) {
    const std::optional<Device> d = m_registry->device(deviceId);
    if (!d || !d->supportsMedia()) {
        qDebug() << "MediaController: no media session for" << deviceId;
        return;
    }

    QPointer<MediaController> self(this);
    auto* watcher = new QFutureWatcher<Session>(this);
    connect(watcher, &QFutureWatcher<Session>::finished, this, [self, watcher, deviceId]() {
        watcher->deleteLater();
        if (!self)
            return;

        const Session session = watcher->result();
        self->m_registry->setAvailablePlayers(deviceId, session.players);
        self->m_registry->setMediaInfo(deviceId, session.info);
        Q_EMIT self->sessionLoaded(deviceId);
    });

    const DaemonClient* client = m_client;
    watcher->setFuture(QtConcurrent::run([client, deviceId]() {
        Session s;
        QString err;
        const auto players = fetchPlayers(*client, deviceId, &err);
        if (!players)
            qWarning().noquote() << "MediaController: playerList failed for" << deviceId << "-" << err;
        s.players = players.value_or(QStringList{});
        s.info = fetchPlayerInfo(*client, deviceId);
        return s;
    }));
}

bool MediaController::selectPlayer(const QString& deviceId, const QString& player, QString* errorOut) {
    if (!m_client->setMediaPlayer(deviceId, player, errorOut))
        return false;
    loadSession(deviceId);
    return true;
}

bool MediaController::sendAction(const QString& deviceId, DaemonClient::MediaAction action, QString* errorOut) {
    if (!m_client->sendMediaAction(deviceId, action, errorOut))
        return false;
    loadSession(deviceId);
    return true;
}

bool MediaController::setVolume(const QString& deviceId, qint32 volume, QString* errorOut) {
    const qint32 clamped = std::clamp(volume, 0, 100);
    if (!m_client->setMediaVolume(deviceId, clamped, errorOut))
        return false;
    loadSession(deviceId);
    return true;
}

bool MediaController::stepVolume(const QString& deviceId, qint32 delta, QString* errorOut) {
    qint32 current = MediaPlayerInfo{}.volume;
    if (const std::optional<Device> d = m_registry->device(deviceId); d && d->mediaInfo)
        current = d->mediaInfo->volume;
    return setVolume(deviceId, current + delta, errorOut);
}

// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "PairingSignalWatcher.h"
#include "BusConnectionPool.h"
#include "DaemonClient.h"
#include "DaemonProtocol.h"

#include <QDebug>
#include <QTimer>
#include <QtDBus/QDBusMessage>

bool PairingEdgeDetector::observe(const QString& deviceId, bool requested) {
    const bool previous = m_lastKnown.value(deviceId, false);
    m_lastKnown.insert(deviceId, requested);
    return requested && !previous;
}

void PairingEdgeDetector::forget(const QString& deviceId) {
    m_lastKnown.remove(deviceId);
}

void PairingEdgeDetector::retainOnly(const QStringList& present) {
    for (auto it = m_lastKnown.begin(); it != m_lastKnown.end();) {
        if (present.contains(it.key()))
            ++it;
        else
            it = m_lastKnown.erase(it);
    }
}

PairingNotification fetchPairingNotification(const DaemonClient& client, const QString& deviceId) {
    PairingNotification n;
    n.deviceId = deviceId;

    QString err;
    n.deviceName = client.deviceString(deviceId, QStringLiteral("name"), &err).value_or(QString());
    if (n.deviceName.isEmpty()) {
        if (!err.isEmpty())
            qWarning().noquote() << "Pairing: could not read name of" << deviceId << "-" << err;
        n.deviceName = QStringLiteral("Unknown Device");
    }

    n.deviceType = client.deviceString(deviceId, QStringLiteral("type")).value_or(QString());
    if (n.deviceType.isEmpty())
        n.deviceType = QStringLiteral("unknown");

    return n;
}

SignalPairingSource::SignalPairingSource(const DaemonClient* client, QObject* parent)
    : PairingEventSource(parent)
    , m_client(client) {}

bool SignalPairingSource::start(QString* errorOut) {
    const auto connection = m_client->pool()->acquire(errorOut);
    if (!connection)
        return false;

    SignalMatch match;
    match.service = QString::fromLatin1(DaemonProtocol::kService);
    match.interface = QString::fromLatin1(DaemonProtocol::kDeviceInterface);
    match.member = QString::fromLatin1(DaemonProtocol::kPairStateChanged);

    return connection->subscribe(match, this, [this](const QDBusMessage& message) {
        handleSignal(message);
    }, errorOut);
}

void SignalPairingSource::handleSignal(const QDBusMessage& message) {
    const std::optional<QString> id = DaemonClient::deviceIdFromPath(message.path());
    if (!id) {
        qDebug() << "Pairing: pairStateChanged on unexpected path" << message.path();
        return;
    }
    const QString& deviceId = *id;

    const QVariantList args = message.arguments();
    if (args.isEmpty() || args.first().metaType() != QMetaType::fromType<qint32>()) {
        qDebug() << "Pairing: pairStateChanged for" << deviceId << "without a state";
        return;
    }

    const auto state = static_cast<PairState>(args.first().toInt());
    switch (state) {
        case PairState::RequestedByPeer: {
            qInfo() << "Pairing: request from" << deviceId;
            Q_EMIT pairingRequested(fetchPairingNotification(*m_client, deviceId));
            break;
        }
        case PairState::NotPaired:
            qDebug() << "Pairing:" << deviceId << "not paired";
            break;
        case PairState::RequestedByUs:
            qDebug() << "Pairing:" << deviceId << "waiting for the peer to accept";
            break;
        case PairState::Paired:
            qDebug() << "Pairing:" << deviceId << "paired";
            break;
        default:
            qDebug() << "Pairing:" << deviceId << "unknown state" << args.first().toInt();
            break;
    }
}

PollingPairingSource::PollingPairingSource(const DaemonClient* client, int intervalMs, QObject* parent)
    : PairingEventSource(parent)
    , m_client(client) {
    m_timer = new QTimer(this);
    m_timer->setInterval(intervalMs);
    connect(m_timer, &QTimer::timeout, this, &PollingPairingSource::pollOnce);
}

bool PollingPairingSource::start(QString* errorOut) {
    Q_UNUSED(errorOut);
    m_timer->start();
    return true;
}

void PollingPairingSource::pollOnce() {
    QString err;
    const std::optional<QStringList> ids = m_client->deviceIds(false, false, &err);
    if (!ids) {
        qDebug().noquote() << "Pairing: poll could not list devices -" << err;
        return;
    }

    m_detector.retainOnly(*ids);
    for (const QString& id : *ids) {
        const std::optional<bool> requested = m_client->deviceBool(id, QStringLiteral("isPairRequestedByPeer"));
        if (!requested)
            continue;

        if (m_detector.observe(id, *requested)) {
            qInfo() << "Pairing: request from" << id << "(polled)";
            Q_EMIT pairingRequested(fetchPairingNotification(*m_client, id));
        }
    }
}

FallbackPairingSource::FallbackPairingSource(PairingEventSource* primary, Factory fallbackFactory, QObject* parent)
    : PairingEventSource(parent)
    , m_primary(primary)
    , m_fallbackFactory(std::move(fallbackFactory)) {
    if (m_primary)
        m_primary->setParent(this);
}

bool FallbackPairingSource::start(QString* errorOut) {
    if (m_active)
        return true;

    QString err;
    if (m_primary && m_primary->start(&err)) {
        adopt(m_primary);
        return true;
    }

    qWarning().noquote() << "Pairing:" << (m_primary ? m_primary->modeName() : QStringLiteral("primary"))
                         << "source unavailable, falling back -" << err;
    if (m_primary) {
        m_primary->deleteLater();
        m_primary = nullptr;
    }

    PairingEventSource* fallback = m_fallbackFactory ? m_fallbackFactory(this) : nullptr;
    if (!fallback) {
        if (errorOut) *errorOut = err.isEmpty() ? QStringLiteral("No pairing source available.") : err;
        return false;
    }

    m_fallbackActive = true;
    if (!fallback->start(errorOut)) {
        fallback->deleteLater();
        return false;
    }
    adopt(fallback);
    return true;
}

QString FallbackPairingSource::modeName() const {
    return m_active ? m_active->modeName() : QStringLiteral("idle");
}

void FallbackPairingSource::adopt(PairingEventSource* source) {
    m_active = source;
    connect(source, &PairingEventSource::pairingRequested, this, &PairingEventSource::pairingRequested);
}

PairingSignalWatcher::PairingSignalWatcher(const DaemonClient* client,
                                           bool forcePolling,
                                           int pollIntervalMs,
                                           QObject* parent)
    : QObject(parent) {
    if (forcePolling) {
        m_source = new PollingPairingSource(client, pollIntervalMs, this);
    } else {
        auto* primary = new SignalPairingSource(client);
        m_source = new FallbackPairingSource(primary, [client, pollIntervalMs](QObject* owner) {
            return new PollingPairingSource(client, pollIntervalMs, owner);
        }, this);
    }

    connect(m_source, &PairingEventSource::pairingRequested, this, &PairingSignalWatcher::pairingRequested);
}

bool PairingSignalWatcher::start(QString* errorOut) {
    if (m_started)
        return true;
    if (!m_source) {
        if (errorOut) *errorOut = QStringLiteral("Pairing watcher was stopped.");
        return false;
    }

    m_started = m_source->start(errorOut);
    qInfo().noquote() << "Pairing: watching in" << mode() << "mode";
    return m_started;
}

void PairingSignalWatcher::stop() {
    if (!m_source)
        return;

    delete m_source;
    m_source = nullptr;
    m_started = false;
    qInfo() << "Pairing: stopped";
}

QString PairingSignalWatcher::mode() const {
    return m_started && m_source ? m_source->modeName() : QStringLiteral("idle");
}

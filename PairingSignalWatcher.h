// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_PAIRINGSIGNALWATCHER_H
#define LINKDECK_PAIRINGSIGNALWATCHER_H

#include "Device.h"

#include <QHash>
#include <QObject>
#include <QString>
#include <QStringList>
#include <functional>

class DaemonClient;
class QDBusMessage;
class QTimer;

// Remembers the last "peer requested pairing" value per device and reports
// only false -> true edges.
class PairingEdgeDetector {
public:
    // True when requested is set and was not set on the previous observation.
    bool observe(const QString& deviceId, bool requested);

    void forget(const QString& deviceId);

    // Forgets every device not in present.
    void retainOnly(const QStringList& present);

    [[nodiscard]] int trackedCount() const { return static_cast<int>(m_lastKnown.size()); }

    [[nodiscard]] bool lastKnown(const QString& deviceId) const { return m_lastKnown.value(deviceId, false); }

private:
    QHash<QString, bool> m_lastKnown;
};

// Device name and type for the notification; falls back to
// "Unknown Device" / "unknown" when the daemon does not answer.
PairingNotification fetchPairingNotification(const DaemonClient& client, const QString& deviceId);

// Something that reports incoming pairing requests.
class PairingEventSource : public QObject {
    Q_OBJECT

public:
    explicit PairingEventSource(QObject* parent = nullptr) : QObject(parent) {}

    // False if the source could not be set up. A source that failed to
    // start never emits.
    virtual bool start(QString* errorOut = nullptr) = 0;

    [[nodiscard]] virtual QString modeName() const = 0;

signals:
    void pairingRequested(const PairingNotification& notification);
};

// pairStateChanged(int) on any device object of the daemon.
class SignalPairingSource final : public PairingEventSource {
    Q_OBJECT

public:
    explicit SignalPairingSource(const DaemonClient* client, QObject* parent = nullptr);

    bool start(QString* errorOut = nullptr) override;
    [[nodiscard]] QString modeName() const override { return QStringLiteral("signal"); }

    void handleSignal(const QDBusMessage& message);

private:
    const DaemonClient* m_client = nullptr;
};

// Reads isPairRequestedByPeer for every device on a timer.
class PollingPairingSource final : public PairingEventSource {
    Q_OBJECT

public:
    PollingPairingSource(const DaemonClient* client, int intervalMs, QObject* parent = nullptr);

    bool start(QString* errorOut = nullptr) override;
    [[nodiscard]] QString modeName() const override { return QStringLiteral("polling"); }

public slots:
    void pollOnce();

    [[nodiscard]] const PairingEdgeDetector& detector() const { return m_detector; }

private:
    const DaemonClient* m_client = nullptr;
    QTimer* m_timer = nullptr;
    PairingEdgeDetector m_detector;
};

// Tries the primary source once; if it cannot start, a fallback source is
// created and used for the rest of the session.
class FallbackPairingSource final : public PairingEventSource {
    Q_OBJECT

public:
    using Factory = std::function<PairingEventSource*(QObject* parent)>;

    FallbackPairingSource(PairingEventSource* primary, Factory fallbackFactory, QObject* parent = nullptr);

    bool start(QString* errorOut = nullptr) override;
    [[nodiscard]] QString modeName() const override;

    [[nodiscard]] bool isFallbackActive() const { return m_fallbackActive; }

private:
    void adopt(PairingEventSource* source);

    PairingEventSource* m_primary = nullptr;
    PairingEventSource* m_active = nullptr;
    Factory m_fallbackFactory;
    bool m_fallbackActive = false;
};

class PairingSignalWatcher final : public QObject {
    Q_OBJECT

public:
    PairingSignalWatcher(const DaemonClient* client,
                         bool forcePolling,
                         int pollIntervalMs,
                         QObject* parent = nullptr);

    bool start(QString* errorOut = nullptr);

    // Tears down the active source with its subscription and poll timer.
    // A stopped watcher cannot be restarted. Not to be called from a
    // pairingRequested() handler.
    void stop();

    // "signal", "polling" or "idle" before start() and after stop().
    [[nodiscard]] QString mode() const;

signals:
    void pairingRequested(const PairingNotification& notification);

private:
    PairingEventSource* m_source = nullptr;
    bool m_started = false;
};

#endif //LINKDECK_PAIRINGSIGNALWATCHER_H

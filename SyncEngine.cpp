// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "SyncEngine.h"
#include "BusConnectionPool.h"
#include "DeviceRegistry.h"
#include "MediaController.h"
#include "NotificationActionBridge.h"
#include "PairingSignalWatcher.h"
#include "ProcessLauncher.h"
#include "sms/ConversationFetcher.h"
#include "sms/SmsSession.h"

#include <QDebug>
#include <QFileInfo>
#include <QFutureWatcher>
#include <QPointer>
#include <QThreadPool>
#include <QTimer>
#include <QtConcurrent/QtConcurrentRun>

namespace {
    // Lets the daemon's own notification show up first.
    constexpr int kPairingNotificationDelayMs = 100;

    constexpr const char* kPairUrlPrefix = "kdeconnect://pair/";
}

SyncEngine::SyncEngine(BusConnectionPool* pool,
                       ProcessLauncher* launcher,
                       const Settings& settings,
                       std::unique_ptr<ContactsProvider> contacts,
                       QObject* parent)
    : QObject(parent)
    , m_pool(pool)
    , m_launcher(launcher)
    , m_settings(settings)
    , m_client(pool)
    , m_contacts(std::move(contacts)) {
    if (!m_contacts)
        m_contacts = std::make_unique<DaemonContactsCache>(&m_client, m_settings.contactsSyncWaitMs);

    m_registry = new DeviceRegistry(&m_client, m_settings.deviceRefreshIntervalMs, this);
    connect(m_registry, &DeviceRegistry::devicesChanged, this, &SyncEngine::devicesChanged);

    m_media = new MediaController(&m_client, m_registry, this);

    m_pairing = new PairingSignalWatcher(&m_client,
                                         m_settings.forcePairingPolling,
                                         m_settings.pairingPollIntervalMs,
                                         this);
    connect(m_pairing, &PairingSignalWatcher::pairingRequested, this, &SyncEngine::onPairingRequested);
}

SyncEngine::~SyncEngine() {
    shutdown();
}

bool SyncEngine::start(QString* errorOut) {
    m_registry->start();
    return m_pairing->start(errorOut);
}

void SyncEngine::shutdown() {
    if (m_shutDown)
        return;
    m_shutDown = true;

    m_registry->stop();
    m_pairing->stop();

    // Nothing may hold or reacquire the connection past cleanup().
    for (const QPointer<NotificationActionBridge>& bridge : std::as_const(m_bridges))
        delete bridge.data();
    m_bridges.clear();

    const QList<SmsSession*> sessions = m_smsSessions.values();
    m_smsSessions.clear();
    qDeleteAll(sessions);

    // Worker jobs borrow m_client.
    QThreadPool::globalInstance()->waitForDone();
    m_pool->cleanup();
    qInfo() << "SyncEngine: shut down";
}

DeviceMap SyncEngine::devices() const {
    return m_registry->devices();
}

QString SyncEngine::pairingMode() const {
    return m_pairing->mode();
}

QList<Conversation> SyncEngine::fetchConversations(const QString& deviceId) const {
    return ConversationFetcher::fetch(m_client, deviceId, m_settings.requestSettleMs);
}

ContactsMap SyncEngine::fetchContacts(const QString& deviceId) {
    return m_contacts->contactsFor(deviceId);
}

SmsSession* SyncEngine::openSmsSession(const QString& deviceId, QString* errorOut) {
    if (SmsSession* existing = m_smsSessions.value(deviceId))
        return existing;

    auto* session = new SmsSession(deviceId, &m_client, m_launcher, m_contacts.get(), m_settings, this);
    connect(session, &SmsSession::messageReceived, this, [this, deviceId](const Message& message) {
        Q_EMIT messageReceived(deviceId, message);
    });
    m_smsSessions.insert(deviceId, session);

    // A session without live updates still reloads periodically.
    if (!session->start(errorOut))
        qWarning() << "SyncEngine: SMS session for" << deviceId << "started without signals";
    return session;
}

void SyncEngine::closeSmsSession(const QString& deviceId) {
    SmsSession* session = m_smsSessions.take(deviceId);
    if (session)
        session->deleteLater();
}

QString SyncEngine::actionName(DeviceAction action) {
    switch (action) {
        case DeviceAction::Ping: return QStringLiteral("ping");
        case DeviceAction::RequestPairing: return QStringLiteral("requestPairing");
        case DeviceAction::AcceptPairing: return QStringLiteral("acceptPairing");
        case DeviceAction::RejectPairing: return QStringLiteral("rejectPairing");
        case DeviceAction::Unpair: return QStringLiteral("unpair");
        case DeviceAction::Ring: return QStringLiteral("ring");
        case DeviceAction::Lock: return QStringLiteral("lock");
    }
    return {};
}

void SyncEngine::performAction(const QString& deviceId, DeviceAction action) {
    const DaemonClient* client = &m_client;
    runAction(deviceId, actionName(action), [client, deviceId, action](QString* errorOut) {
        switch (action) {
            case DeviceAction::Ping: return client->ping(deviceId, errorOut);
            case DeviceAction::RequestPairing: return client->requestPairing(deviceId, errorOut);
            case DeviceAction::AcceptPairing: return client->acceptPairing(deviceId, errorOut);
            case DeviceAction::RejectPairing: return client->rejectPairing(deviceId, errorOut);
            case DeviceAction::Unpair: return client->unpair(deviceId, errorOut);
            case DeviceAction::Ring: return client->ringDevice(deviceId, errorOut);
            case DeviceAction::Lock: return client->lockDevice(deviceId, errorOut);
        }
        return false;
    });
}

void SyncEngine::sendClipboard(const QString& deviceId, const QString& text) {
    const DaemonClient* client = &m_client;
    runAction(deviceId, QStringLiteral("sendClipboard"), [client, deviceId, text](QString* errorOut) {
        return client->sendClipboard(deviceId, text, errorOut);
    });
}

void SyncEngine::shareFiles(const QString& deviceId, const QStringList& pathsOrUrls) {
    const DaemonClient* client = &m_client;
    runAction(deviceId, QStringLiteral("share"), [client, deviceId, pathsOrUrls](QString* errorOut) {
        bool allOk = true;
        for (const QString& item : pathsOrUrls) {
            QString err;
            if (!client->shareUrl(deviceId, item, &err)) {
                qWarning().noquote() << "SyncEngine: sharing" << item << "failed -" << err;
                if (errorOut && errorOut->isEmpty()) *errorOut = err;
                allOk = false;
            }
        }
        return allOk;
    });
}

void SyncEngine::browseFiles(const QString& deviceId) {
    runAction(deviceId, QStringLiteral("browse"), [this, deviceId](QString* errorOut) {
        return browseFilesBlocking(deviceId, errorOut);
    });
}

bool SyncEngine::browseFilesBlocking(const QString& deviceId, QString* errorOut) const {
    QString err;
    if (!m_client.sftpIsMounted(deviceId, &err).value_or(false)) {
        if (!m_client.sftpMount(deviceId, &err))
            qWarning().noquote() << "SyncEngine: sftp mount failed for" << deviceId << "-" << err;
    }

    const QString mountPoint = m_client.sftpMountPoint(deviceId, &err).value_or(QString());
    if (!mountPoint.isEmpty() && QFileInfo(mountPoint).isDir()) {
        if (m_launcher && m_launcher->startDetached(QStringLiteral("xdg-open"), {mountPoint}, &err))
            return true;
        qWarning().noquote() << "SyncEngine: cannot open" << mountPoint << "-" << err;
    }

    // Let the daemon open its own browser.
    return m_client.sftpStartBrowsing(deviceId, errorOut);
}

void SyncEngine::runAction(const QString& deviceId, const QString& label, std::function<bool(QString*)> job) {
    auto* watcher = new QFutureWatcher<ActionResult>(this);
    connect(watcher, &QFutureWatcher<ActionResult>::finished, this, [this, watcher, deviceId, label]() {
        watcher->deleteLater();

        const ActionResult r = watcher->result();
        if (!r.ok)
            qWarning().noquote() << "SyncEngine:" << label << "on" << deviceId << "failed -" << r.error;
        Q_EMIT actionFinished(deviceId, label, r.ok, r.error);
        if (!m_shutDown)
            m_registry->refresh();
    });

    watcher->setFuture(QtConcurrent::run([job = std::move(job)]() {
        ActionResult r;
        r.ok = job(&r.error);
        return r;
    }));
}

void SyncEngine::onPairingRequested(const PairingNotification& notification) {
    Q_EMIT pairingRequested(notification);
    m_registry->refresh();

    QTimer::singleShot(kPairingNotificationDelayMs, this, [this, notification]() {
        if (m_shutDown)
            return;

        NotificationActionBridge::Options options;
        options.appName = m_settings.notificationAppName;
        options.fallbackProgram = m_settings.settingsProgram;

        auto* bridge = new NotificationActionBridge(m_pool, m_launcher, options, this);
        connect(bridge, &NotificationActionBridge::finished, bridge, &QObject::deleteLater);
        m_bridges.removeAll(nullptr);
        m_bridges.append(bridge);

        QString err;
        const bool shown = bridge->notifyAndAwaitAction(
            QStringLiteral("%1 wants to pair").arg(notification.deviceName),
            QStringLiteral("Click to open settings and accept or reject"),
            QString::fromLatin1(kPairUrlPrefix) + notification.deviceId,
            &err);
        if (!shown) {
            qWarning().noquote() << "SyncEngine: pairing notification failed -" << err;
            bridge->deleteLater();
        }
    });
}

// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_SYNCENGINE_H
#define LINKDECK_SYNCENGINE_H

#include "DaemonClient.h"
#include "Device.h"
#include "Settings.h"
#include "sms/ContactsProvider.h"
#include "sms/SmsModels.h"

#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <functional>
#include <memory>

class BusConnectionPool;
class DeviceRegistry;
class MediaController;
class NotificationActionBridge;
class PairingSignalWatcher;
class ProcessLauncher;
class SmsSession;

// What the UI talks to: the merged device map, per-device messaging
// sessions, device actions, and a stream of pairing and message events.
class SyncEngine final : public QObject {
    Q_OBJECT

public:
    enum class DeviceAction {
        Ping,
        RequestPairing,
        AcceptPairing,
        RejectPairing,
        Unpair,
        Ring,
        Lock,
    };

    // contacts may be null, in which case the daemon's contact cache is used.
    SyncEngine(BusConnectionPool* pool,
               ProcessLauncher* launcher,
               const Settings& settings,
               std::unique_ptr<ContactsProvider> contacts = nullptr,
               QObject* parent = nullptr);
    ~SyncEngine() override;

    // Starts device refreshes and pairing detection.
    bool start(QString* errorOut = nullptr);

    // Stops everything and releases the shared bus connection. Idempotent.
    void shutdown();

    [[nodiscard]] DeviceMap devices() const;
    [[nodiscard]] const DaemonClient& client() const { return m_client; }
    [[nodiscard]] DeviceRegistry* registry() const { return m_registry; }
    [[nodiscard]] MediaController* media() const { return m_media; }
    [[nodiscard]] QString pairingMode() const;

    // Blocking pulls, meant for worker threads.
    QList<Conversation> fetchConversations(const QString& deviceId) const;
    ContactsMap fetchContacts(const QString& deviceId);

    // Creates and starts the session on first use.
    SmsSession* openSmsSession(const QString& deviceId, QString* errorOut = nullptr);
    [[nodiscard]] SmsSession* smsSession(const QString& deviceId) const { return m_smsSessions.value(deviceId); }
    void closeSmsSession(const QString& deviceId);

    // Device actions run off-thread; actionFinished() reports the outcome
    // and the device list is refreshed afterwards.
    void performAction(const QString& deviceId, DeviceAction action);
    void sendClipboard(const QString& deviceId, const QString& text);
    void shareFiles(const QString& deviceId, const QStringList& pathsOrUrls);
    void browseFiles(const QString& deviceId);

    [[nodiscard]] static QString actionName(DeviceAction action);

signals:
    void devicesChanged();
    void pairingRequested(const PairingNotification& notification);
    void messageReceived(const QString& deviceId, const Message& message);
    void actionFinished(const QString& deviceId, const QString& action, bool ok, const QString& error);

private:
    struct ActionResult {
        bool ok = false;
        QString error;
    };

    void runAction(const QString& deviceId, const QString& label, std::function<bool(QString*)> job);
    void onPairingRequested(const PairingNotification& notification);
    bool browseFilesBlocking(const QString& deviceId, QString* errorOut) const;

    BusConnectionPool* m_pool = nullptr;
    ProcessLauncher* m_launcher = nullptr;
    Settings m_settings;
    DaemonClient m_client;
    std::unique_ptr<ContactsProvider> m_contacts;

    DeviceRegistry* m_registry = nullptr;
    MediaController* m_media = nullptr;
    PairingSignalWatcher* m_pairing = nullptr;
    QHash<QString, SmsSession*> m_smsSessions;
    QList<QPointer<NotificationActionBridge>> m_bridges;

    bool m_shutDown = false;
};

#endif //LINKDECK_SYNCENGINE_H

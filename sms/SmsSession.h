// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_SMS_SMSSESSION_H
#define LINKDECK_SMS_SMSSESSION_H

#include "ConversationStore.h"
#include "SmsModels.h"

#include "Settings.h"

#include <QObject>
#include <QString>
#include <optional>

class ContactsProvider;
class ConversationSignalWatcher;
class DaemonClient;
class OptimisticSendCoordinator;
class ProcessLauncher;
class QTimer;

// Messaging state for one device: conversation list, the selected thread,
// live message updates and sending.
class SmsSession final : public QObject {
    Q_OBJECT

public:
    SmsSession(QString deviceId,
               const DaemonClient* client,
               ProcessLauncher* launcher,
               ContactsProvider* contacts,
               const Settings& settings,
               QObject* parent = nullptr);

    // Subscribes to message signals and starts loading conversations and
    // contacts. A failed subscription is reported but the session still
    // works from periodic reloads.
    bool start(QString* errorOut = nullptr);

    void loadConversations();
    void loadContacts();

    // Returns false for threads the daemon cannot be asked about (local or
    // informational ones) or when the request fails.
    bool selectThread(const QString& threadId);
    bool refreshThread();

    // Sends on the selected thread.
    std::optional<QString> send(const QString& body);
    std::optional<QString> sendTo(const QString& threadId, const QString& body);

    // Selects the thread for phoneNumber, creating a local one if needed.
    // Returns the thread id, or an empty string for a blank number.
    QString startChatWithNumber(const QString& phoneNumber);

    [[nodiscard]] const ConversationStore& store() const { return m_store; }
    [[nodiscard]] const QString& deviceId() const { return m_deviceId; }
    [[nodiscard]] const ContactsMap& contacts() const { return m_contacts; }
    [[nodiscard]] bool isLoadingConversations() const { return m_loadingConversations; }

    // Entry point for incoming daemon messages.
    void handleIncoming(const Message& message);

signals:
    void conversationsChanged();
    void messagesChanged(const QString& threadId);
    void messageReceived(const Message& message);
    void contactsLoaded(int count);
    void deliveryFinished(const QString& placeholderId, bool delivered);

private:
    QString m_deviceId;
    const DaemonClient* m_client = nullptr;
    ContactsProvider* m_contactsProvider = nullptr;
    Settings m_settings;

    ConversationStore m_store;
    ContactsMap m_contacts;

    ConversationSignalWatcher* m_watcher = nullptr;
    OptimisticSendCoordinator* m_sender = nullptr;
    QTimer* m_reloadTimer = nullptr;

    bool m_loadingConversations = false;
    bool m_loadingContacts = false;
};

#endif //LINKDECK_SMS_SMSSESSION_H

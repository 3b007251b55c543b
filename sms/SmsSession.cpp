// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "SmsSession.h"
#include "ContactsProvider.h"
#include "ConversationFetcher.h"
#include "ConversationSignalWatcher.h"
#include "OptimisticSendCoordinator.h"
#include "SmsSender.h"

#include "DaemonClient.h"
#include "Utils.h"

#include <QDebug>
#include <QFutureWatcher>
#include <QTimer>
#include <QtConcurrent/QtConcurrentRun>

SmsSession::SmsSession(QString deviceId,
                       const DaemonClient* client,
                       ProcessLauncher* launcher,
                       ContactsProvider* contacts,
                       const Settings& settings,
                       QObject* parent)
    : QObject(parent)
    , m_deviceId(std::move(deviceId))
    , m_client(client)
    , m_contactsProvider(contacts)
    , m_settings(settings) {
    m_watcher = new ConversationSignalWatcher(client->pool(), m_deviceId, this);
    connect(m_watcher, &ConversationSignalWatcher::messageReceived, this, &SmsSession::handleIncoming);

    m_sender = new OptimisticSendCoordinator(m_deviceId,
                                             &m_store,
                                             SmsSender(client, launcher, m_settings.cliProgram),
                                             this);
    connect(m_sender, &OptimisticSendCoordinator::placeholderInserted, this, [this](const Message& placeholder) {
        Q_EMIT messagesChanged(placeholder.threadId);
        Q_EMIT conversationsChanged();
    });
    connect(m_sender, &OptimisticSendCoordinator::deliveryFinished, this, &SmsSession::deliveryFinished);

    m_reloadTimer = new QTimer(this);
    m_reloadTimer->setInterval(m_settings.conversationReloadMs);
    connect(m_reloadTimer, &QTimer::timeout, this, &SmsSession::loadConversations);
}

bool SmsSession::start(QString* errorOut) {
    const bool subscribed = m_watcher->start(errorOut);
    if (!subscribed)
        qWarning() << "SmsSession: live updates unavailable for" << m_deviceId << "- relying on reloads";

    loadConversations();
    loadContacts();
    m_reloadTimer->start();
    return subscribed;
}

void SmsSession::loadConversations() {
    if (m_loadingConversations)
        return;
    m_loadingConversations = true;

    auto* watcher = new QFutureWatcher<QList<Conversation>>(this);
    connect(watcher, &QFutureWatcher<QList<Conversation>>::finished, this, [this, watcher]() {
        watcher->deleteLater();
        m_loadingConversations = false;

        m_store.setConversations(watcher->result());
        m_store.applyContacts(m_contacts);
        Q_EMIT conversationsChanged();
    });

    const DaemonClient* client = m_client;
    const QString deviceId = m_deviceId;
    const int settleMs = m_settings.requestSettleMs;
    watcher->setFuture(QtConcurrent::run([client, deviceId, settleMs]() {
        return ConversationFetcher::fetch(*client, deviceId, settleMs);
    }));
}

void SmsSession::loadContacts() {
    if (!m_contactsProvider || m_loadingContacts)
        return;
    m_loadingContacts = true;

    auto* watcher = new QFutureWatcher<ContactsMap>(this);
    connect(watcher, &QFutureWatcher<ContactsMap>::finished, this, [this, watcher]() {
        watcher->deleteLater();
        m_loadingContacts = false;

        m_contacts = watcher->result();
        const int renamed = m_store.applyContacts(m_contacts);
        if (renamed > 0)
            Q_EMIT conversationsChanged();
        Q_EMIT contactsLoaded(static_cast<int>(m_contacts.size()));
    });

    ContactsProvider* provider = m_contactsProvider;
    const QString deviceId = m_deviceId;
    watcher->setFuture(QtConcurrent::run([provider, deviceId]() {
        return provider->contactsFor(deviceId);
    }));
}

bool SmsSession::selectThread(const QString& threadId) {
    m_store.selectThread(threadId);
    Q_EMIT messagesChanged(threadId);
    return refreshThread();
}

bool SmsSession::refreshThread() {
    const std::optional<QString>& selected = m_store.selectedThread();
    if (!selected)
        return false;

    bool numeric = false;
    const qint64 thread = selected->toLongLong(&numeric);
    if (!numeric) {
        qDebug() << "SmsSession: not requesting local thread" << *selected;
        return false;
    }

    QString err;
    if (!m_client->requestConversation(m_deviceId, thread, 0, m_settings.pageSize, &err)) {
        qWarning().noquote() << "SmsSession: requestConversation failed for" << *selected << "-" << err;
        return false;
    }
    return true;
}

std::optional<QString> SmsSession::send(const QString& body) {
    const std::optional<QString>& selected = m_store.selectedThread();
    if (!selected)
        return std::nullopt;
    return sendTo(*selected, body);
}

std::optional<QString> SmsSession::sendTo(const QString& threadId, const QString& body) {
    return m_sender->send(threadId, body);
}

QString SmsSession::startChatWithNumber(const QString& phoneNumber) {
    const QString number = phoneNumber.trimmed();
    if (number.isEmpty())
        return {};

    if (const std::optional<QString> existing = m_store.findThreadByPhone(number)) {
        selectThread(*existing);
        return *existing;
    }

    QString name;
    for (auto it = m_contacts.cbegin(); it != m_contacts.cend(); ++it) {
        if (Utils::phoneNumbersMatch(it.key(), number)) {
            name = it.value();
            break;
        }
    }

    const QString threadId = m_store.insertLocalConversation(number, name, Utils::nowMillis());
    Q_EMIT conversationsChanged();
    selectThread(threadId);
    return threadId;
}

void SmsSession::handleIncoming(const Message& message) {
    if (m_settings.collapseOptimistic) {
        const int collapsed = m_store.collapsePlaceholders(message, m_settings.collapseWindowMs);
        if (collapsed > 0)
            qDebug() << "SmsSession: replaced" << collapsed << "placeholder(s) in" << message.threadId;
    }

    const bool inserted = m_store.applyIncoming(message);
    Q_EMIT messageReceived(message);
    Q_EMIT conversationsChanged();
    if (inserted)
        Q_EMIT messagesChanged(message.threadId);
}

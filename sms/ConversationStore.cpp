// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "ConversationStore.h"

#include "Utils.h"

#include <QSet>

#include <algorithm>

QList<Message> ConversationStore::selectedMessages() const {
    if (!m_selectedThread)
        return {};
    return m_messages.value(*m_selectedThread);
}

std::optional<Conversation> ConversationStore::conversation(const QString& threadId) const {
    const auto it = std::find_if(m_conversations.cbegin(), m_conversations.cend(), [&](const Conversation& c) {
        return c.threadId == threadId;
    });
    if (it == m_conversations.cend())
        return std::nullopt;
    return *it;
}

bool ConversationStore::hasConversation(const QString& threadId) const {
    return conversation(threadId).has_value();
}

void ConversationStore::setConversations(const QList<Conversation>& conversations) {
    QList<Conversation> sorted = conversations;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Conversation& a, const Conversation& b) {
        return a.timestamp > b.timestamp;
    });

    m_conversations.clear();
    QSet<QString> seen;
    for (const Conversation& c : sorted) {
        if (seen.contains(c.threadId))
            continue;
        seen.insert(c.threadId);
        m_conversations.push_back(c);
    }
}

void ConversationStore::selectThread(const QString& threadId) {
    m_selectedThread = threadId;
    m_messages.remove(threadId);
}

bool ConversationStore::insertMessage(const Message& message) {
    QList<Message>& list = m_messages[message.threadId];
    const bool exists = std::any_of(list.cbegin(), list.cend(), [&](const Message& m) {
        return m.id == message.id;
    });
    if (exists)
        return false;

    list.push_back(message);
    sortMessages(list);
    return true;
}

void ConversationStore::touchConversation(const QString& threadId, const QString& preview, qint64 timestamp) {
    auto it = std::find_if(m_conversations.begin(), m_conversations.end(), [&](const Conversation& c) {
        return c.threadId == threadId;
    });
    if (it == m_conversations.end())
        return;

    it->lastMessage = preview;
    it->timestamp = timestamp;
    sortConversations();
}

bool ConversationStore::applyIncoming(const Message& message) {
    bool inserted = false;
    if (m_selectedThread && *m_selectedThread == message.threadId)
        inserted = insertMessage(message);

    touchConversation(message.threadId, message.body, message.timestamp);
    return inserted;
}

int ConversationStore::collapsePlaceholders(const Message& delivered, qint64 windowMs) {
    if (!delivered.isSent() || delivered.isPlaceholder())
        return 0;

    auto it = m_messages.find(delivered.threadId);
    if (it == m_messages.end())
        return 0;

    const auto removed = it->removeIf([&](const Message& m) {
        return m.isPlaceholder()
            && m.body == delivered.body
            && qAbs(delivered.timestamp - m.timestamp) <= windowMs;
    });
    return static_cast<int>(removed);
}

int ConversationStore::applyContacts(const ContactsMap& contacts) {
    int updated = 0;
    for (Conversation& c : m_conversations) {
        for (auto it = contacts.cbegin(); it != contacts.cend(); ++it) {
            if (Utils::phoneNumbersMatch(it.key(), c.phoneNumber)) {
                if (c.contactName != it.value()) {
                    c.contactName = it.value();
                    ++updated;
                }
                break;
            }
        }
    }
    return updated;
}

std::optional<QString> ConversationStore::findThreadByPhone(const QString& phoneNumber) const {
    for (const Conversation& c : m_conversations) {
        if (Utils::phoneNumbersMatch(c.phoneNumber, phoneNumber))
            return c.threadId;
    }
    return std::nullopt;
}

QString ConversationStore::insertLocalConversation(const QString& phoneNumber, const QString& contactName, qint64 nowMs) {
    Conversation c;
    c.threadId = QStringLiteral("new_%1").arg(nowMs);
    c.phoneNumber = phoneNumber;
    c.contactName = contactName.isEmpty() ? phoneNumber : contactName;
    c.lastMessage = QStringLiteral("New conversation");
    c.timestamp = nowMs;
    c.unread = false;

    m_conversations.push_front(c);
    sortConversations();
    return c.threadId;
}

void ConversationStore::sortConversations() {
    std::stable_sort(m_conversations.begin(), m_conversations.end(), [](const Conversation& a, const Conversation& b) {
        return a.timestamp > b.timestamp;
    });
}

void ConversationStore::sortMessages(QList<Message>& messages) {
    std::stable_sort(messages.begin(), messages.end(), [](const Message& a, const Message& b) {
        return a.timestamp < b.timestamp;
    });
}

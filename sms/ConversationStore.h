// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_SMS_CONVERSATIONSTORE_H
#define LINKDECK_SMS_CONVERSATIONSTORE_H

#include "SmsModels.h"

#include <QHash>
#include <QList>
#include <QString>
#include <optional>

// In-memory conversations and messages for one device.
//
// Conversations are kept newest first; each thread's messages oldest first
// with unique ids. Every mutating call restores both orderings.
class ConversationStore {
public:
    [[nodiscard]] const QList<Conversation>& conversations() const { return m_conversations; }
    [[nodiscard]] QList<Message> messages(const QString& threadId) const { return m_messages.value(threadId); }
    [[nodiscard]] QList<Message> selectedMessages() const;

    [[nodiscard]] const std::optional<QString>& selectedThread() const { return m_selectedThread; }
    [[nodiscard]] std::optional<Conversation> conversation(const QString& threadId) const;
    [[nodiscard]] bool hasConversation(const QString& threadId) const;

    // Replaces the whole list. Duplicate thread ids keep the newest entry.
    void setConversations(const QList<Conversation>& conversations);

    // Makes threadId current and empties its message list, ready to be
    // refilled by the daemon.
    void selectThread(const QString& threadId);

    // False if the id is already present in the thread.
    bool insertMessage(const Message& message);

    void touchConversation(const QString& threadId, const QString& preview, qint64 timestamp);

    // Incoming daemon message. Only the selected thread's messages are kept;
    // the preview is updated either way.
    bool applyIncoming(const Message& message);

    // Removes sending_ placeholders in the message's thread that carry the
    // same body and lie within windowMs of it. Returns how many went.
    int collapsePlaceholders(const Message& delivered, qint64 windowMs);

    // Renames conversations whose number matches a contact.
    int applyContacts(const ContactsMap& contacts);

    [[nodiscard]] std::optional<QString> findThreadByPhone(const QString& phoneNumber) const;

    // Adds a local new_<nowMs> conversation and returns its thread id.
    QString insertLocalConversation(const QString& phoneNumber, const QString& contactName, qint64 nowMs);

private:
    void sortConversations();
    static void sortMessages(QList<Message>& messages);

    QList<Conversation> m_conversations;
    QHash<QString, QList<Message>> m_messages;
    std::optional<QString> m_selectedThread;
};

#endif //LINKDECK_SMS_CONVERSATIONSTORE_H

// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_SMS_SMSMODELS_H
#define LINKDECK_SMS_SMSMODELS_H

#include <QHash>
#include <QMetaType>
#include <QString>

struct Conversation {
    QString threadId;
    QString contactName;
    QString phoneNumber;
    QString lastMessage;
    qint64 timestamp = 0;
    bool unread = false;
};

struct Message {
    static constexpr qint32 kTypeReceived = 1;
    static constexpr qint32 kTypeSent = 2;

    QString id;
    QString threadId;
    QString body;
    QString address;
    qint64 timestamp = 0;
    qint32 type = kTypeReceived;
    bool read = true;

    [[nodiscard]] bool isSent() const { return type == kTypeSent; }
    [[nodiscard]] bool isPlaceholder() const { return id.startsWith(QStringLiteral("sending_")); }
};

// Phone number -> display name.
using ContactsMap = QHash<QString, QString>;

Q_DECLARE_METATYPE(Conversation)
Q_DECLARE_METATYPE(Message)

#endif //LINKDECK_SMS_SMSMODELS_H

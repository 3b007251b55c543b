// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "SmsPayload.h"
#include "PayloadDecoder.h"

namespace SmsPayload {
    namespace {
        const QString kUnknownPhone = QStringLiteral("Unknown");
        const QString kUnknownThread = QStringLiteral("unknown");

        QString threadIdOf(const PayloadDecoder& fields) {
            const std::optional<QVariant> v = fields.nodeAt({kThreadId});
            if (!v || v->metaType() != QMetaType::fromType<qint64>())
                return kUnknownThread;
            return QString::number(v->toLongLong());
        }
    }

    Message decodeMessage(const PayloadDecoder& fields, qint64 nowMs) {
        Message m;
        m.body = fields.valueAt<QString>(kBody, QString());
        m.address = fields.valueAtPath<QString>({kAddresses, 0, 0}, kUnknownPhone);
        m.timestamp = fields.valueAt<qint64>(kTimestamp, nowMs);
        m.type = fields.valueAt<qint32>(kType, Message::kTypeReceived);
        m.threadId = threadIdOf(fields);
        m.id = m.threadId + QLatin1Char('_') + QString::number(m.timestamp);
        m.read = true;
        return m;
    }

    Conversation decodeConversation(const PayloadDecoder& fields, qint64 nowMs) {
        const Message m = decodeMessage(fields, nowMs);

        Conversation c;
        c.threadId = m.threadId;
        c.phoneNumber = m.address;
        c.contactName = m.address;
        c.lastMessage = m.body;
        c.timestamp = m.timestamp;
        c.unread = false;
        return c;
    }

    std::optional<Message> messageFromSignalArgument(const QVariant& raw, qint64 nowMs) {
        const PayloadDecoder fields = PayloadDecoder::fromSignalArgument(raw);
        if (fields.isEmpty())
            return std::nullopt;
        return decodeMessage(fields, nowMs);
    }
}

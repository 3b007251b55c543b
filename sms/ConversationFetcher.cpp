// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "ConversationFetcher.h"
#include "SmsPayload.h"

#include "DaemonClient.h"
#include "DbusVariantUtils.h"
#include "PayloadDecoder.h"
#include "Utils.h"

#include <QDebug>
#include <QThread>

namespace ConversationFetcher {
    QList<Conversation> fetch(const DaemonClient& client, const QString& deviceId, int settleMs) {
        QString err;
        if (!client.requestAllConversationThreads(deviceId, &err))
            qWarning().noquote() << "Conversations: thread request failed for" << deviceId << "-" << err;

        if (settleMs > 0)
            QThread::msleep(static_cast<unsigned long>(settleMs));

        err.clear();
        const std::optional<QVariantList> raw = client.activeConversations(deviceId, &err);
        if (!raw) {
            qWarning().noquote() << "Conversations: listing failed for" << deviceId << "-" << err;
            return {};
        }

        const qint64 now = Utils::nowMillis();
        QList<Conversation> out;
        out.reserve(raw->size());
        for (const QVariant& entry : *raw) {
            if (!DbusVariant::isList(entry)) {
                qDebug() << "Conversations: skipping entry that is not a structure";
                continue;
            }
            out.push_back(SmsPayload::decodeConversation(PayloadDecoder(entry.toList()), now));
        }

        if (out.isEmpty())
            return {placeholderEntry()};

        qInfo() << "Conversations: loaded" << out.size() << "thread(s) for" << deviceId;
        return out;
    }

    Conversation placeholderEntry() {
        Conversation c;
        c.threadId = QString::fromLatin1(kPlaceholderThreadId);
        c.contactName = QStringLiteral("📱 KDE Connect SMS");
        c.phoneNumber = QStringLiteral("System");
        c.lastMessage = QStringLiteral("No conversations found. Make sure SMS plugin is enabled!");
        c.timestamp = Utils::nowMillis();
        c.unread = false;
        return c;
    }
}

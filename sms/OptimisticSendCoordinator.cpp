// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "OptimisticSendCoordinator.h"
#include "ConversationStore.h"

#include "Utils.h"

#include <QDebug>
#include <QFutureWatcher>
#include <QtConcurrent/QtConcurrentRun>

OptimisticSendCoordinator::OptimisticSendCoordinator(QString deviceId,
                                                     ConversationStore* store,
                                                     SmsSender sender,
                                                     QObject* parent)
    : QObject(parent)
    , m_deviceId(std::move(deviceId))
    , m_store(store)
    , m_sender(std::move(sender)) {}

std::optional<QString> OptimisticSendCoordinator::send(const QString& threadId, const QString& body) {
    if (body.trimmed().isEmpty())
        return std::nullopt;

    const std::optional<Conversation> conversation = m_store->conversation(threadId);
    if (!conversation) {
        qDebug() << "OptimisticSend: no conversation" << threadId;
        return std::nullopt;
    }

    const qint64 now = Utils::nowMillis();

    Message placeholder;
    placeholder.id = QStringLiteral("sending_%1").arg(now);
    placeholder.threadId = threadId;
    placeholder.body = body;
    placeholder.address = conversation->phoneNumber;
    placeholder.timestamp = now;
    placeholder.type = Message::kTypeSent;
    placeholder.read = true;

    // Sends within the same millisecond get a sequence suffix.
    for (int seq = 1; !m_store->insertMessage(placeholder); ++seq)
        placeholder.id = QStringLiteral("sending_%1_%2").arg(now).arg(seq);
    m_store->touchConversation(threadId, body, now);
    Q_EMIT placeholderInserted(placeholder);

    ++m_pending;
    auto* watcher = new QFutureWatcher<bool>(this);
    connect(watcher, &QFutureWatcher<bool>::finished, this, [this, watcher, id = placeholder.id]() {
        watcher->deleteLater();
        --m_pending;

        const bool delivered = watcher->result();
        if (!delivered)
            qWarning() << "OptimisticSend: delivery failed, keeping" << id;
        Q_EMIT deliveryFinished(id, delivered);
    });

    const SmsSender sender = m_sender;
    const QString deviceId = m_deviceId;
    const QString phone = conversation->phoneNumber;
    watcher->setFuture(QtConcurrent::run([sender, deviceId, phone, body]() {
        return sender.send(deviceId, phone, body);
    }));

    return placeholder.id;
}

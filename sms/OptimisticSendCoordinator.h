// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_SMS_OPTIMISTICSENDCOORDINATOR_H
#define LINKDECK_SMS_OPTIMISTICSENDCOORDINATOR_H

#include "SmsModels.h"
#include "SmsSender.h"

#include <QObject>
#include <QString>
#include <optional>

class ConversationStore;

// Shows an outgoing message right away as a sending_<ms> placeholder, then
// delivers it in the background. A second placeholder in the same
// millisecond becomes sending_<ms>_<n>.
//
// The placeholder is not removed when delivery finishes; the daemon's own
// copy of the message arrives later as a separate record.
class OptimisticSendCoordinator final : public QObject {
    Q_OBJECT

public:
    OptimisticSendCoordinator(QString deviceId,
                              ConversationStore* store,
                              SmsSender sender,
                              QObject* parent = nullptr);

    // Returns the placeholder id, or nullopt (and does nothing at all) when
    // the thread is unknown or the body is blank.
    std::optional<QString> send(const QString& threadId, const QString& body);

    [[nodiscard]] int pendingDeliveries() const { return m_pending; }

signals:
    void placeholderInserted(const Message& placeholder);
    void deliveryFinished(const QString& placeholderId, bool delivered);

private:
    QString m_deviceId;
    ConversationStore* m_store = nullptr;
    SmsSender m_sender;
    int m_pending = 0;
};

#endif //LINKDECK_SMS_OPTIMISTICSENDCOORDINATOR_H

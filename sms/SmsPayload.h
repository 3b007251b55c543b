// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_SMS_SMSPAYLOAD_H
#define LINKDECK_SMS_SMSPAYLOAD_H

#include "SmsModels.h"

#include <QVariant>
#include <optional>

class PayloadDecoder;

// Positional layout of the daemon's message structure, as carried by
// conversationUpdated and activeConversations.
namespace SmsPayload {
    inline constexpr int kBody = 1;
    inline constexpr int kAddresses = 2;
    inline constexpr int kTimestamp = 3;
    inline constexpr int kType = 4;
    inline constexpr int kThreadId = 6;

    Message decodeMessage(const PayloadDecoder& fields, qint64 nowMs);

    // Contact name starts out as the phone number; contacts replace it later.
    Conversation decodeConversation(const PayloadDecoder& fields, qint64 nowMs);

    // Convenience for a raw signal argument. nullopt if it is not structure-shaped.
    std::optional<Message> messageFromSignalArgument(const QVariant& raw, qint64 nowMs);
}

#endif //LINKDECK_SMS_SMSPAYLOAD_H

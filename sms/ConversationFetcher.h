// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_SMS_CONVERSATIONFETCHER_H
#define LINKDECK_SMS_CONVERSATIONFETCHER_H

#include "SmsModels.h"

#include <QList>
#include <QString>

class DaemonClient;

namespace ConversationFetcher {
    // Asks the phone for its threads, gives it settleMs to answer, then
    // reads the daemon's list. Blocking.
    //
    // Empty if the daemon cannot be reached. If it answers with no threads
    // the list holds a single informational entry instead.
    QList<Conversation> fetch(const DaemonClient& client, const QString& deviceId, int settleMs);

    Conversation placeholderEntry();

    inline constexpr const char* kPlaceholderThreadId = "info_1";
}

#endif //LINKDECK_SMS_CONVERSATIONFETCHER_H

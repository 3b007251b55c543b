// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_SMS_CONTACTSPROVIDER_H
#define LINKDECK_SMS_CONTACTSPROVIDER_H

#include "SmsModels.h"

#include <QByteArray>
#include <QString>

class DaemonClient;

class ContactsProvider {
public:
    virtual ~ContactsProvider() = default;

    // May block. An empty map means "no contacts", never an error.
    virtual ContactsMap contactsFor(const QString& deviceId) = 0;
};

// Asks the daemon to sync contacts from the phone, then reads the JSON
// cache it keeps under <dataRoot>/<deviceId>/contacts.
class DaemonContactsCache final : public ContactsProvider {
public:
    // dataRoot defaults to ~/.local/share/kdeconnect.
    DaemonContactsCache(const DaemonClient* client, int syncWaitMs, QString dataRoot = QString());

    ContactsMap contactsFor(const QString& deviceId) override;

    // {"<uid>": {"name": "...", "phoneNumber": [{"number": "..."}]}, ...}
    static ContactsMap parseCache(const QByteArray& json);

    [[nodiscard]] QString cacheFile(const QString& deviceId) const;

private:
    const DaemonClient* m_client = nullptr;
    int m_syncWaitMs = 0;
    QString m_dataRoot;
};

#endif //LINKDECK_SMS_CONTACTSPROVIDER_H

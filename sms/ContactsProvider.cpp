// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "ContactsProvider.h"

#include "DaemonClient.h"
#include "DaemonProtocol.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QStandardPaths>
#include <QThread>

DaemonContactsCache::DaemonContactsCache(const DaemonClient* client, int syncWaitMs, QString dataRoot)
    : m_client(client)
    , m_syncWaitMs(syncWaitMs)
    , m_dataRoot(std::move(dataRoot)) {
    if (m_dataRoot.isEmpty()) {
        m_dataRoot = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
            + QStringLiteral("/kdeconnect");
    }
}

QString DaemonContactsCache::cacheFile(const QString& deviceId) const {
    return QDir(m_dataRoot).filePath(deviceId + QStringLiteral("/contacts"));
}

ContactsMap DaemonContactsCache::contactsFor(const QString& deviceId) {
    QString err;
    const std::optional<bool> hasContacts =
        m_client->hasPlugin(deviceId, QString::fromLatin1(DaemonProtocol::kPluginContacts), &err);

    if (hasContacts.value_or(false)) {
        if (m_client->synchronizeContacts(deviceId, &err)) {
            // The daemon writes the cache asynchronously.
            if (m_syncWaitMs > 0)
                QThread::msleep(static_cast<unsigned long>(m_syncWaitMs));
        } else {
            qWarning().noquote() << "Contacts: sync request failed for" << deviceId << "-" << err;
        }
    } else if (!err.isEmpty()) {
        qDebug().noquote() << "Contacts: plugin check failed for" << deviceId << "-" << err;
    }

    QFile f(cacheFile(deviceId));
    if (!f.exists()) {
        qDebug() << "Contacts: no cache at" << f.fileName();
        return {};
    }
    if (!f.open(QIODevice::ReadOnly)) {
        qWarning() << "Contacts: cannot read" << f.fileName() << "-" << f.errorString();
        return {};
    }

    const ContactsMap contacts = parseCache(f.readAll());
    qInfo() << "Contacts: loaded" << contacts.size() << "number(s) for" << deviceId;
    return contacts;
}

ContactsMap DaemonContactsCache::parseCache(const QByteArray& json) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning().noquote() << "Contacts: cache is not a JSON object -" << parseError.errorString();
        return {};
    }

    ContactsMap out;
    const QJsonObject root = doc.object();
    for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
        const QJsonObject contact = it.value().toObject();
        const QString name = contact.value(QStringLiteral("name")).toString();
        if (name.isEmpty())
            continue;

        const QJsonArray numbers = contact.value(QStringLiteral("phoneNumber")).toArray();
        for (const QJsonValue& n : numbers) {
            const QString number = n.toObject().value(QStringLiteral("number")).toString();
            if (!number.isEmpty())
                out.insert(number, name);
        }
    }
    return out;
}

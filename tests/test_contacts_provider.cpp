// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QTest>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "DaemonClient.h"
#include "FakeBusConnection.h"
#include "sms/ContactsProvider.h"

namespace {
    const QString kDevice = QStringLiteral("abc123");

    const QByteArray kCache = R"({
        "1": {"name": "Alice", "phoneNumber": [{"number": "+1 555 123 4567"}, {"number": "555-000-1111"}]},
        "2": {"name": "", "phoneNumber": [{"number": "+1 555 999 0000"}]},
        "3": {"name": "Bob", "phoneNumber": []}
    })";
}

class TestContactsProvider : public QObject {
    Q_OBJECT

private slots:
    void init() {
        m_bus = std::make_shared<FakeBusConnection>();
        m_pool = makeFakePool(m_bus);
        m_client = std::make_unique<DaemonClient>(m_pool.get());
    }

    void testParseCache() {
        const ContactsMap contacts = DaemonContactsCache::parseCache(kCache);
        QCOMPARE(contacts.size(), 2);
        QCOMPARE(contacts.value(QStringLiteral("+1 555 123 4567")), QStringLiteral("Alice"));
        QCOMPARE(contacts.value(QStringLiteral("555-000-1111")), QStringLiteral("Alice"));
    }

    void testParseGarbage() {
        QVERIFY(DaemonContactsCache::parseCache("not json").isEmpty());
        QVERIFY(DaemonContactsCache::parseCache("[1, 2]").isEmpty());
    }

    void testReadsCacheAfterSync() {
        QTemporaryDir root;
        QVERIFY(root.isValid());
        QVERIFY(QDir(root.path()).mkpath(kDevice));
        QFile f(QDir(root.path()).filePath(kDevice + QStringLiteral("/contacts")));
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write(kCache);
        f.close();

        m_bus->setPlugins(kDevice, {QString::fromLatin1(DaemonProtocol::kPluginContacts)});
        m_bus->setReply(DaemonClient::devicePath(kDevice) + QStringLiteral("/contacts"),
                        QString::fromLatin1(DaemonProtocol::kContactsInterface),
                        QStringLiteral("synchronizeRemoteWithLocal"));

        DaemonContactsCache cache(m_client.get(), 0, root.path());
        const ContactsMap contacts = cache.contactsFor(kDevice);

        QCOMPARE(contacts.size(), 2);
        QCOMPARE(m_bus->callCount(QStringLiteral("synchronizeRemoteWithLocal")), 1);
    }

    void testMissingCacheIsEmpty() {
        QTemporaryDir root;
        DaemonContactsCache cache(m_client.get(), 0, root.path());

        QVERIFY(cache.contactsFor(kDevice).isEmpty());
        // no contacts plugin, no sync request
        QCOMPARE(m_bus->callCount(QStringLiteral("synchronizeRemoteWithLocal")), 0);
    }

private:
    std::shared_ptr<FakeBusConnection> m_bus;
    std::unique_ptr<BusConnectionPool> m_pool;
    std::unique_ptr<DaemonClient> m_client;
};

QTEST_MAIN(TestContactsProvider)
#include "test_contacts_provider.moc"

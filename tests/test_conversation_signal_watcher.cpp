// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QTest>
#include <QSignalSpy>

#include "FakeBusConnection.h"
#include "Utils.h"
#include "sms/ConversationSignalWatcher.h"

namespace {
    const QString kDevice = QStringLiteral("abc123");

    QVariantList messageFields(const QVariant& timestamp) {
        return {
            QVariant::fromValue(qint32(1)),
            QStringLiteral("hey there"),
            QVariantList{QVariantList{QStringLiteral("+15551234567")}},
            timestamp,
            QVariant::fromValue(qint32(1)),
            QVariant::fromValue(qint32(1)),
            QVariant::fromValue(qint64(42)),
        };
    }

    QDBusMessage conversationSignal(const QString& path, const QString& member, const QVariantList& fields) {
        return FakeBusConnection::makeSignal(path,
                                             QString::fromLatin1(DaemonProtocol::kConversationsInterface),
                                             member,
                                             {QVariant(fields)});
    }
}

class TestConversationSignalWatcher : public QObject {
    Q_OBJECT

private slots:
    void init() {
        m_bus = std::make_shared<FakeBusConnection>();
        m_pool = makeFakePool(m_bus);
    }

    void testMatchingSignalProducesMessage() {
        ConversationSignalWatcher watcher(m_pool.get(), kDevice);
        QVERIFY(watcher.start());
        QSignalSpy spy(&watcher, &ConversationSignalWatcher::messageReceived);

        m_bus->deliver(conversationSignal(DaemonClient::devicePath(kDevice),
                                          QString::fromLatin1(DaemonProtocol::kConversationUpdated),
                                          messageFields(QVariant::fromValue(qint64(1700000000000)))));

        QCOMPARE(spy.count(), 1);
        const auto m = spy[0][0].value<Message>();
        QCOMPARE(m.threadId, QStringLiteral("42"));
        QCOMPARE(m.body, QStringLiteral("hey there"));
        QCOMPARE(m.address, QStringLiteral("+15551234567"));
        QCOMPARE(m.timestamp, qint64(1700000000000));
        QCOMPARE(m.type, Message::kTypeReceived);
        QCOMPARE(m.id, QStringLiteral("42_1700000000000"));
        QVERIFY(m.read);
    }

    void testOtherDeviceIsIgnored() {
        ConversationSignalWatcher watcher(m_pool.get(), kDevice);
        QVERIFY(watcher.start());
        QSignalSpy spy(&watcher, &ConversationSignalWatcher::messageReceived);

        m_bus->deliver(conversationSignal(DaemonClient::devicePath(QStringLiteral("zzz999")),
                                          QString::fromLatin1(DaemonProtocol::kConversationUpdated),
                                          messageFields(QVariant::fromValue(qint64(1)))));

        QCOMPARE(spy.count(), 0);
    }

    void testOtherMemberIsIgnored() {
        ConversationSignalWatcher watcher(m_pool.get(), kDevice);
        QVERIFY(watcher.start());
        QSignalSpy spy(&watcher, &ConversationSignalWatcher::messageReceived);

        m_bus->deliver(conversationSignal(DaemonClient::devicePath(kDevice),
                                          QStringLiteral("conversationCreated"),
                                          messageFields(QVariant::fromValue(qint64(1)))));

        QCOMPARE(spy.count(), 0);
    }

    void testWrongTimestampTypeFallsBackToNow() {
        ConversationSignalWatcher watcher(m_pool.get(), kDevice);
        QVERIFY(watcher.start());
        QSignalSpy spy(&watcher, &ConversationSignalWatcher::messageReceived);

        const qint64 before = Utils::nowMillis();
        m_bus->deliver(conversationSignal(DaemonClient::devicePath(kDevice),
                                          QString::fromLatin1(DaemonProtocol::kConversationUpdated),
                                          messageFields(QStringLiteral("yesterday"))));
        const qint64 after = Utils::nowMillis();

        QCOMPARE(spy.count(), 1);
        const auto m = spy[0][0].value<Message>();
        QVERIFY(m.timestamp >= before);
        QVERIFY(m.timestamp <= after);
    }

    void testMissingFieldsUseDefaults() {
        ConversationSignalWatcher watcher(m_pool.get(), kDevice);
        QVERIFY(watcher.start());
        QSignalSpy spy(&watcher, &ConversationSignalWatcher::messageReceived);

        m_bus->deliver(conversationSignal(DaemonClient::devicePath(kDevice),
                                          QString::fromLatin1(DaemonProtocol::kConversationUpdated),
                                          {QVariant::fromValue(qint32(1)), QStringLiteral("short")}));

        QCOMPARE(spy.count(), 1);
        const auto m = spy[0][0].value<Message>();
        QCOMPARE(m.threadId, QStringLiteral("unknown"));
        QCOMPARE(m.address, QStringLiteral("Unknown"));
        QCOMPARE(m.body, QStringLiteral("short"));
    }

    void testStopDropsSubscription() {
        ConversationSignalWatcher watcher(m_pool.get(), kDevice);
        QVERIFY(watcher.start());
        QSignalSpy spy(&watcher, &ConversationSignalWatcher::messageReceived);

        watcher.stop();
        QVERIFY(!watcher.isActive());
        m_bus->deliver(conversationSignal(DaemonClient::devicePath(kDevice),
                                          QString::fromLatin1(DaemonProtocol::kConversationUpdated),
                                          messageFields(QVariant::fromValue(qint64(1)))));

        QCOMPARE(spy.count(), 0);
    }

    void testSubscribeFailureIsReported() {
        m_bus->failSubscribe = true;
        ConversationSignalWatcher watcher(m_pool.get(), kDevice);

        QString err;
        QVERIFY(!watcher.start(&err));
        QVERIFY(!err.isEmpty());
        QVERIFY(!watcher.isActive());
    }

private:
    std::shared_ptr<FakeBusConnection> m_bus;
    std::unique_ptr<BusConnectionPool> m_pool;
};

QTEST_MAIN(TestConversationSignalWatcher)
#include "test_conversation_signal_watcher.moc"

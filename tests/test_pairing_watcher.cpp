// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QTest>
#include <QSignalSpy>

#include "DaemonClient.h"
#include "FakeBusConnection.h"
#include "PairingSignalWatcher.h"

namespace {
    const QString kDevice = QStringLiteral("abc123");

    QDBusMessage pairStateSignal(const QString& deviceId, qint32 state) {
        return FakeBusConnection::makeSignal(DaemonClient::devicePath(deviceId),
                                             QString::fromLatin1(DaemonProtocol::kDeviceInterface),
                                             QString::fromLatin1(DaemonProtocol::kPairStateChanged),
                                             {QVariant::fromValue(state)});
    }
}

class TestPairingWatcher : public QObject {
    Q_OBJECT

private slots:
    void init() {
        m_bus = std::make_shared<FakeBusConnection>();
        m_pool = makeFakePool(m_bus);
        m_client = std::make_unique<DaemonClient>(m_pool.get());

        m_bus->setDeviceList({kDevice});
        m_bus->setDeviceProperty(kDevice, QStringLiteral("name"), QStringLiteral("Pixel 8"));
        m_bus->setDeviceProperty(kDevice, QStringLiteral("type"), QStringLiteral("phone"));
    }

    void testEdgeDetectorReportsRisingEdgesOnly() {
        PairingEdgeDetector detector;
        const QList<bool> samples{false, false, true, true, false, true};
        QList<int> edges;
        for (int i = 0; i < samples.size(); ++i) {
            if (detector.observe(kDevice, samples.at(i)))
                edges << i;
        }
        QCOMPARE(edges, (QList<int>{2, 5}));
    }

    void testEdgeDetectorTracksDevicesSeparately() {
        PairingEdgeDetector detector;
        QVERIFY(detector.observe(QStringLiteral("a"), true));
        QVERIFY(detector.observe(QStringLiteral("b"), true));
        QVERIFY(!detector.observe(QStringLiteral("a"), true));

        detector.forget(QStringLiteral("a"));
        QVERIFY(!detector.lastKnown(QStringLiteral("a")));
        QVERIFY(detector.observe(QStringLiteral("a"), true));
    }

    void testPollingEmitsOncePerRequest() {
        PollingPairingSource source(m_client.get(), 60000);
        QSignalSpy spy(&source, &PairingEventSource::pairingRequested);

        m_bus->setDeviceProperty(kDevice, QStringLiteral("isPairRequestedByPeer"), false);
        source.pollOnce();
        m_bus->setDeviceProperty(kDevice, QStringLiteral("isPairRequestedByPeer"), true);
        source.pollOnce();
        source.pollOnce();

        QCOMPARE(spy.count(), 1);
        const auto n = spy[0][0].value<PairingNotification>();
        QCOMPARE(n.deviceId, kDevice);
        QCOMPARE(n.deviceName, QStringLiteral("Pixel 8"));
        QCOMPARE(n.deviceType, QStringLiteral("phone"));

        m_bus->setDeviceProperty(kDevice, QStringLiteral("isPairRequestedByPeer"), false);
        source.pollOnce();
        m_bus->setDeviceProperty(kDevice, QStringLiteral("isPairRequestedByPeer"), true);
        source.pollOnce();
        QCOMPARE(spy.count(), 2);
    }

    void testSignalSourceEmitsOnPeerRequest() {
        SignalPairingSource source(m_client.get());
        QVERIFY(source.start());
        QSignalSpy spy(&source, &PairingEventSource::pairingRequested);

        m_bus->deliver(pairStateSignal(kDevice, 3));
        QCOMPARE(spy.count(), 0);

        m_bus->deliver(pairStateSignal(kDevice, 2));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy[0][0].value<PairingNotification>().deviceName, QStringLiteral("Pixel 8"));
    }

    void testNotificationDetailsFallBack() {
        const PairingNotification n = fetchPairingNotification(*m_client, QStringLiteral("ghost"));
        QCOMPARE(n.deviceId, QStringLiteral("ghost"));
        QCOMPARE(n.deviceName, QStringLiteral("Unknown Device"));
        QCOMPARE(n.deviceType, QStringLiteral("unknown"));
    }

    void testMalformedSignalIsIgnored() {
        SignalPairingSource source(m_client.get());
        QVERIFY(source.start());
        QSignalSpy spy(&source, &PairingEventSource::pairingRequested);

        m_bus->deliver(FakeBusConnection::makeSignal(DaemonClient::devicePath(kDevice),
                                                     QString::fromLatin1(DaemonProtocol::kDeviceInterface),
                                                     QString::fromLatin1(DaemonProtocol::kPairStateChanged),
                                                     {QStringLiteral("2")}));
        QCOMPARE(spy.count(), 0);
    }

    void testWatcherPrefersSignals() {
        PairingSignalWatcher watcher(m_client.get(), false, 60000);
        QCOMPARE(watcher.mode(), QStringLiteral("idle"));
        QVERIFY(watcher.start());
        QCOMPARE(watcher.mode(), QStringLiteral("signal"));

        QSignalSpy spy(&watcher, &PairingSignalWatcher::pairingRequested);
        m_bus->deliver(pairStateSignal(kDevice, 2));
        QCOMPARE(spy.count(), 1);
    }

    void testWatcherFallsBackToPolling() {
        m_bus->failSubscribe = true;
        m_bus->setDeviceProperty(kDevice, QStringLiteral("isPairRequestedByPeer"), true);

        PairingSignalWatcher watcher(m_client.get(), false, 20);
        QSignalSpy spy(&watcher, &PairingSignalWatcher::pairingRequested);
        QVERIFY(watcher.start());
        QCOMPARE(watcher.mode(), QStringLiteral("polling"));

        QTRY_COMPARE(spy.count(), 1);
        QTest::qWait(100);
        QCOMPARE(spy.count(), 1);
    }

    void testForcedPollingSkipsSignals() {
        PairingSignalWatcher watcher(m_client.get(), true, 60000);
        QVERIFY(watcher.start());
        QCOMPARE(watcher.mode(), QStringLiteral("polling"));
        QCOMPARE(m_bus->liveSubscriptions(), 0);
    }

    void testSignalOutsideDeviceTreeIsIgnored() {
        SignalPairingSource source(m_client.get());
        QVERIFY(source.start());
        QSignalSpy spy(&source, &PairingEventSource::pairingRequested);

        m_bus->deliver(FakeBusConnection::makeSignal(QStringLiteral("/modules/kdeconnect"),
                                                     QString::fromLatin1(DaemonProtocol::kDeviceInterface),
                                                     QString::fromLatin1(DaemonProtocol::kPairStateChanged),
                                                     {QVariant::fromValue(qint32(2))}));
        QCOMPARE(spy.count(), 0);

        m_bus->deliver(pairStateSignal(kDevice, 2));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy[0][0].value<PairingNotification>().deviceId, kDevice);
    }

    void testPollingForgetsVanishedDevices() {
        PollingPairingSource source(m_client.get(), 60000);
        QSignalSpy spy(&source, &PairingEventSource::pairingRequested);

        m_bus->setDeviceProperty(kDevice, QStringLiteral("isPairRequestedByPeer"), true);
        source.pollOnce();
        QCOMPARE(spy.count(), 1);
        QCOMPARE(source.detector().trackedCount(), 1);

        m_bus->setDeviceList({});
        source.pollOnce();
        QCOMPARE(source.detector().trackedCount(), 0);

        // a device that comes back with a request still pending is reported again
        m_bus->setDeviceList({kDevice});
        source.pollOnce();
        QCOMPARE(spy.count(), 2);
        QCOMPARE(source.detector().trackedCount(), 1);
    }

    void testEdgeDetectorRetainsOnlyPresentDevices() {
        PairingEdgeDetector detector;
        detector.observe(QStringLiteral("a"), true);
        detector.observe(QStringLiteral("b"), false);
        detector.observe(QStringLiteral("c"), true);

        detector.retainOnly({QStringLiteral("c")});
        QCOMPARE(detector.trackedCount(), 1);
        QVERIFY(detector.lastKnown(QStringLiteral("c")));
        QVERIFY(!detector.lastKnown(QStringLiteral("a")));
    }

    void testStoppedWatcherGoesQuiet() {
        m_bus->setDeviceProperty(kDevice, QStringLiteral("isPairRequestedByPeer"), false);

        PairingSignalWatcher watcher(m_client.get(), true, 20);
        QVERIFY(watcher.start());
        QTRY_VERIFY(m_bus->callCount(QStringLiteral("devices")) > 0);

        watcher.stop();
        QCOMPARE(watcher.mode(), QStringLiteral("idle"));
        m_bus->clearCalls();
        QTest::qWait(100);
        QCOMPARE(m_bus->calls().size(), 0);

        QString err;
        QVERIFY(!watcher.start(&err));
        QVERIFY(!err.isEmpty());
    }

    void testStoppingSignalWatcherDropsSubscription() {
        PairingSignalWatcher watcher(m_client.get(), false, 60000);
        QVERIFY(watcher.start());
        QCOMPARE(m_bus->liveSubscriptions(), 1);

        watcher.stop();
        QCOMPARE(m_bus->liveSubscriptions(), 0);
        watcher.stop();
    }

private:
    std::shared_ptr<FakeBusConnection> m_bus;
    std::unique_ptr<BusConnectionPool> m_pool;
    std::unique_ptr<DaemonClient> m_client;
};

QTEST_MAIN(TestPairingWatcher)
#include "test_pairing_watcher.moc"

// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QTest>
#include <QSignalSpy>
#include <QThreadPool>
#include <QtDBus/QDBusVariant>

#include "DaemonClient.h"
#include "DeviceRegistry.h"
#include "FakeBusConnection.h"
#include "MediaController.h"

namespace {
    const QString kDevice = QStringLiteral("abc123");
}

class TestDeviceRegistry : public QObject {
    Q_OBJECT

private slots:
    void init() {
        m_bus = std::make_shared<FakeBusConnection>();
        m_pool = makeFakePool(m_bus);
        m_client = std::make_unique<DaemonClient>(m_pool.get());

        m_bus->setDeviceList({kDevice});
        m_bus->setDeviceProperty(kDevice, QStringLiteral("name"), QStringLiteral("Pixel"));
        m_bus->setDeviceProperty(kDevice, QStringLiteral("isReachable"), true);
        m_bus->setDeviceProperty(kDevice, QStringLiteral("isPaired"), true);
        m_bus->setPlugins(kDevice, {QString::fromLatin1(DaemonProtocol::kPluginMpris)});

        const QString mpris = DaemonClient::devicePath(kDevice) + QStringLiteral("/mprisremote");
        const QString iface = QString::fromLatin1(DaemonProtocol::kMprisInterface);
        m_bus->setProperty(mpris, iface, QStringLiteral("playerList"),
                           QStringList{QStringLiteral("Spotify"), QStringLiteral("VLC")});
        m_bus->setProperty(mpris, iface, QStringLiteral("player"), QStringLiteral("Spotify"));
        m_bus->setProperty(mpris, iface, QStringLiteral("title"), QStringLiteral("Song"));
        m_bus->setProperty(mpris, iface, QStringLiteral("volume"), QVariant::fromValue(qint32(70)));

        m_lastSet.clear();
        m_bus->setResponder(mpris, QString::fromLatin1(DaemonProtocol::kPropertiesInterface), QStringLiteral("Set"),
                            [this](const QDBusMessage& call) {
            const QVariantList args = call.arguments();
            m_lastSet = {args.value(1).toString(), qvariant_cast<QDBusVariant>(args.value(2)).variant()};
            return call.createReply();
        });
    }

    void cleanup() {
        // background jobs still hold the client
        QThreadPool::globalInstance()->waitForDone();
    }

    void testRefreshLoadsDevices() {
        DeviceRegistry registry(m_client.get(), 60000);
        QSignalSpy finished(&registry, &DeviceRegistry::refreshFinished);

        registry.refresh();
        QVERIFY(registry.isRefreshing());
        QVERIFY(finished.wait());

        QCOMPARE(finished[0][0].toInt(), 1);
        QVERIFY(!registry.isRefreshing());
        const auto d = registry.device(kDevice);
        QVERIFY(d.has_value());
        QCOMPARE(d->name, QStringLiteral("Pixel"));
        QVERIFY(d->supportsMedia());
    }

    void testOverlappingRefreshesAreCoalesced() {
        DeviceRegistry registry(m_client.get(), 60000);
        QSignalSpy finished(&registry, &DeviceRegistry::refreshFinished);

        registry.refresh();
        registry.refresh();
        registry.refresh();

        QTRY_COMPARE(finished.count(), 2);
        QTest::qWait(50);
        QCOMPARE(finished.count(), 2);
    }

    void testSessionStateSurvivesRefresh() {
        DeviceRegistry registry(m_client.get(), 60000);
        QSignalSpy finished(&registry, &DeviceRegistry::refreshFinished);
        registry.refresh();
        QVERIFY(finished.wait());

        registry.setAvailablePlayers(kDevice, {QStringLiteral("VLC")});
        registry.refresh();
        QVERIFY(finished.wait());

        QCOMPARE(registry.device(kDevice)->availablePlayers, QStringList{QStringLiteral("VLC")});
    }

    void testSessionUpdatesForUnknownDevicesAreIgnored() {
        DeviceRegistry registry(m_client.get(), 60000);
        QSignalSpy changed(&registry, &DeviceRegistry::devicesChanged);

        registry.setAvailablePlayers(QStringLiteral("nobody"), {QStringLiteral("VLC")});
        registry.setMediaInfo(QStringLiteral("nobody"), MediaPlayerInfo{});

        QCOMPARE(changed.count(), 0);
        QVERIFY(!registry.device(QStringLiteral("nobody")).has_value());
    }

    void testMediaSessionIsLoaded() {
        DeviceRegistry registry(m_client.get(), 60000);
        QSignalSpy finished(&registry, &DeviceRegistry::refreshFinished);
        registry.refresh();
        QVERIFY(finished.wait());

        MediaController media(m_client.get(), &registry);
        QSignalSpy loaded(&media, &MediaController::sessionLoaded);
        media.loadSession(kDevice);
        QVERIFY(loaded.wait());

        const Device d = *registry.device(kDevice);
        QCOMPARE(d.availablePlayers, (QStringList{QStringLiteral("Spotify"), QStringLiteral("VLC")}));
        QCOMPARE(d.currentPlayer.value_or(QString()), QStringLiteral("Spotify"));
        QCOMPARE(d.mediaInfo->title, QStringLiteral("Song"));
        QCOMPARE(d.mediaInfo->volume, 70);
        // unread fields keep their defaults
        QVERIFY(d.mediaInfo->canPlay);
        QVERIFY(!d.mediaInfo->canSeek);
    }

    void testVolumeIsClampedAndStepped() {
        DeviceRegistry registry(m_client.get(), 60000);
        QSignalSpy finished(&registry, &DeviceRegistry::refreshFinished);
        registry.refresh();
        QVERIFY(finished.wait());

        MediaController media(m_client.get(), &registry);
        QVERIFY(media.setVolume(kDevice, 140));
        QCOMPARE(m_lastSet.value(0).toString(), QStringLiteral("volume"));
        QCOMPARE(m_lastSet.value(1).toInt(), 100);

        // the reloaded session reports 70
        QSignalSpy loaded(&media, &MediaController::sessionLoaded);
        QVERIFY(loaded.wait());
        QVERIFY(media.stepVolume(kDevice, MediaController::kVolumeStep));
        QCOMPARE(m_lastSet.value(1).toInt(), 80);
    }

    void testMediaIsSkippedForDisconnectedDevices() {
        DeviceRegistry registry(m_client.get(), 60000);
        MediaController media(m_client.get(), &registry);
        QSignalSpy loaded(&media, &MediaController::sessionLoaded);

        media.loadSession(kDevice);
        QTest::qWait(50);
        QCOMPARE(loaded.count(), 0);
    }

private:
    std::shared_ptr<FakeBusConnection> m_bus;
    std::unique_ptr<BusConnectionPool> m_pool;
    std::unique_ptr<DaemonClient> m_client;
    QVariantList m_lastSet;
};

QTEST_MAIN(TestDeviceRegistry)
#include "test_device_registry.moc"

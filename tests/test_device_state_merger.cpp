// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QTest>

#include "DeviceStateMerger.h"

namespace {
    Device makeDevice(const QString& id, const QString& name) {
        Device d;
        d.id = id;
        d.name = name;
        d.type = QStringLiteral("phone");
        return d;
    }
}

class TestDeviceStateMerger : public QObject {
    Q_OBJECT

private slots:
    void testMediaSessionIsCarriedOver() {
        Device old = makeDevice(QStringLiteral("x"), QStringLiteral("Old name"));
        old.availablePlayers = {QStringLiteral("Spotify")};
        old.currentPlayer = QStringLiteral("Spotify");
        MediaPlayerInfo info;
        info.player = QStringLiteral("Spotify");
        info.title = QStringLiteral("Song");
        old.mediaInfo = info;

        DeviceMap previous;
        previous.insert(old.id, old);

        Device fresh = makeDevice(QStringLiteral("x"), QStringLiteral("New name"));
        fresh.batteryLevel = 40;

        const DeviceMap merged = DeviceStateMerger::merge(previous, {fresh});
        QCOMPARE(merged.size(), 1);

        const Device& d = merged.value(QStringLiteral("x"));
        QCOMPARE(d.name, QStringLiteral("New name"));
        QCOMPARE(d.batteryLevel.value_or(-1), 40);
        QCOMPARE(d.availablePlayers, QStringList{QStringLiteral("Spotify")});
        QCOMPARE(d.currentPlayer.value_or(QString()), QStringLiteral("Spotify"));
        QVERIFY(d.mediaInfo.has_value());
        QCOMPARE(d.mediaInfo->title, QStringLiteral("Song"));
    }

    void testVanishedDevicesAreDropped() {
        DeviceMap previous;
        previous.insert(QStringLiteral("gone"), makeDevice(QStringLiteral("gone"), QStringLiteral("Gone")));

        const DeviceMap merged = DeviceStateMerger::merge(previous, {makeDevice(QStringLiteral("y"), QStringLiteral("Y"))});
        QCOMPARE(merged.size(), 1);
        QVERIFY(merged.contains(QStringLiteral("y")));
        QVERIFY(!merged.contains(QStringLiteral("gone")));
    }

    void testNewDevicesHaveNoSession() {
        const DeviceMap merged = DeviceStateMerger::merge({}, {makeDevice(QStringLiteral("n"), QStringLiteral("N"))});
        const Device& d = merged.value(QStringLiteral("n"));
        QVERIFY(d.availablePlayers.isEmpty());
        QVERIFY(!d.currentPlayer.has_value());
        QVERIFY(!d.mediaInfo.has_value());
    }

    void testEmptySnapshotClearsEverything() {
        DeviceMap previous;
        previous.insert(QStringLiteral("a"), makeDevice(QStringLiteral("a"), QStringLiteral("A")));
        QVERIFY(DeviceStateMerger::merge(previous, {}).isEmpty());
    }
};

QTEST_MAIN(TestDeviceStateMerger)
#include "test_device_state_merger.moc"

// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Settings.h"

#include <QDebug>
#include <QSettings>

namespace {
    // Missing, non-numeric or out-of-range values keep the default.
    int readInt(QSettings& s, const QString& key, int fallback, int minValue, int maxValue) {
        if (!s.contains(key))
            return fallback;

        bool ok = false;
        const int v = s.value(key).toInt(&ok);
        if (!ok || v < minValue || v > maxValue) {
            qWarning() << "Settings: ignoring invalid value for" << s.group() + QLatin1Char('/') + key
                       << s.value(key);
            return fallback;
        }
        return v;
    }

    bool readBool(QSettings& s, const QString& key, bool fallback) {
        if (!s.contains(key))
            return fallback;
        return s.value(key, fallback).toBool();
    }

    QString readString(QSettings& s, const QString& key, const QString& fallback) {
        const QString v = s.value(key, fallback).toString().trimmed();
        return v.isEmpty() ? fallback : v;
    }
}

Settings Settings::load() {
    QSettings s;
    return load(s);
}

Settings Settings::load(QSettings& s) {
    Settings out;

    s.beginGroup(QStringLiteral("devices"));
    out.deviceRefreshIntervalMs = readInt(s, QStringLiteral("refreshIntervalMs"), out.deviceRefreshIntervalMs, 250, 3600000);
    s.endGroup();

    s.beginGroup(QStringLiteral("pairing"));
    out.forcePairingPolling = readBool(s, QStringLiteral("forcePolling"), out.forcePairingPolling);
    out.pairingPollIntervalMs = readInt(s, QStringLiteral("pollIntervalMs"), out.pairingPollIntervalMs, 250, 3600000);
    s.endGroup();

    s.beginGroup(QStringLiteral("sms"));
    out.conversationReloadMs = readInt(s, QStringLiteral("conversationReloadMs"), out.conversationReloadMs, 1000, 3600000);
    out.requestSettleMs = readInt(s, QStringLiteral("requestSettleMs"), out.requestSettleMs, 0, 60000);
    out.pageSize = readInt(s, QStringLiteral("pageSize"), out.pageSize, 1, 10000);
    out.cliProgram = readString(s, QStringLiteral("cliProgram"), out.cliProgram);
    out.collapseOptimistic = readBool(s, QStringLiteral("collapseOptimistic"), out.collapseOptimistic);
    out.collapseWindowMs = readInt(s, QStringLiteral("collapseWindowMs"), out.collapseWindowMs, 0, 86400000);
    s.endGroup();

    s.beginGroup(QStringLiteral("notifications"));
    out.notificationAppName = readString(s, QStringLiteral("appName"), out.notificationAppName);
    out.settingsProgram = readString(s, QStringLiteral("settingsProgram"), out.settingsProgram);
    s.endGroup();

    s.beginGroup(QStringLiteral("contacts"));
    out.contactsSyncWaitMs = readInt(s, QStringLiteral("syncWaitMs"), out.contactsSyncWaitMs, 0, 60000);
    s.endGroup();

    return out;
}

void Settings::save(QSettings& s) const {
    s.beginGroup(QStringLiteral("devices"));
    s.setValue(QStringLiteral("refreshIntervalMs"), deviceRefreshIntervalMs);
    s.endGroup();

    s.beginGroup(QStringLiteral("pairing"));
    s.setValue(QStringLiteral("forcePolling"), forcePairingPolling);
    s.setValue(QStringLiteral("pollIntervalMs"), pairingPollIntervalMs);
    s.endGroup();

    s.beginGroup(QStringLiteral("sms"));
    s.setValue(QStringLiteral("conversationReloadMs"), conversationReloadMs);
    s.setValue(QStringLiteral("requestSettleMs"), requestSettleMs);
    s.setValue(QStringLiteral("pageSize"), pageSize);
    s.setValue(QStringLiteral("cliProgram"), cliProgram);
    s.setValue(QStringLiteral("collapseOptimistic"), collapseOptimistic);
    s.setValue(QStringLiteral("collapseWindowMs"), collapseWindowMs);
    s.endGroup();

    s.beginGroup(QStringLiteral("notifications"));
    s.setValue(QStringLiteral("appName"), notificationAppName);
    s.setValue(QStringLiteral("settingsProgram"), settingsProgram);
    s.endGroup();

    s.beginGroup(QStringLiteral("contacts"));
    s.setValue(QStringLiteral("syncWaitMs"), contactsSyncWaitMs);
    s.endGroup();
}

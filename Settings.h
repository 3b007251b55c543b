// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_SETTINGS_H
#define LINKDECK_SETTINGS_H

#include <QString>

class QSettings;

struct Settings {
    // devices
    int deviceRefreshIntervalMs = 5000;

    // pairing
    bool forcePairingPolling = false;
    int pairingPollIntervalMs = 3000;

    // sms
    int conversationReloadMs = 30000;
    int requestSettleMs = 1000;
    int pageSize = 50;
    QString cliProgram = QStringLiteral("kdeconnect-cli");
    bool collapseOptimistic = false;
    int collapseWindowMs = 120000;

    // notifications
    QString notificationAppName = QStringLiteral("linkdeck");
    QString settingsProgram = QStringLiteral("linkdeck-settings");

    // contacts
    int contactsSyncWaitMs = 3000;

    // Reads from the application's default QSettings store.
    static Settings load();
    static Settings load(QSettings& s);

    void save(QSettings& s) const;
};

#endif //LINKDECK_SETTINGS_H

// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_SMS_SMSSENDER_H
#define LINKDECK_SMS_SMSSENDER_H

#include <QString>

class DaemonClient;
class ProcessLauncher;

// Delivers one text message: through the daemon's command line tool first,
// and through the daemon's D-Bus API only if the tool fails.
// Blocking; meant to run on a worker thread.
class SmsSender {
public:
    static constexpr int kCliTimeoutMs = 30000;

    SmsSender(const DaemonClient* client, ProcessLauncher* launcher, QString cliProgram);

    bool send(const QString& deviceId, const QString& phoneNumber, const QString& body) const;

private:
    bool sendViaCli(const QString& deviceId, const QString& phoneNumber, const QString& body, QString* errorOut) const;
    bool sendViaDbus(const QString& deviceId, const QString& phoneNumber, const QString& body, QString* errorOut) const;

    const DaemonClient* m_client = nullptr;
    ProcessLauncher* m_launcher = nullptr;
    QString m_cliProgram;
};

#endif //LINKDECK_SMS_SMSSENDER_H

// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "SmsSender.h"

#include "DaemonClient.h"
#include "ProcessLauncher.h"

#include <QDebug>

SmsSender::SmsSender(const DaemonClient* client, ProcessLauncher* launcher, QString cliProgram)
    : m_client(client)
    , m_launcher(launcher)
    , m_cliProgram(std::move(cliProgram)) {}

bool SmsSender::send(const QString& deviceId, const QString& phoneNumber, const QString& body) const {
    QString err;
    if (sendViaCli(deviceId, phoneNumber, body, &err)) {
        qInfo() << "SmsSender: sent to" << phoneNumber << "via" << m_cliProgram;
        return true;
    }
    qWarning().noquote() << "SmsSender:" << m_cliProgram << "failed, trying D-Bus -" << err;

    err.clear();
    if (sendViaDbus(deviceId, phoneNumber, body, &err)) {
        qInfo() << "SmsSender: sent to" << phoneNumber << "via D-Bus";
        return true;
    }
    qWarning().noquote() << "SmsSender: D-Bus send failed -" << err;
    return false;
}

bool SmsSender::sendViaCli(const QString& deviceId, const QString& phoneNumber, const QString& body,
                           QString* errorOut) const {
    if (!m_launcher) {
        if (errorOut) *errorOut = QStringLiteral("no process launcher");
        return false;
    }

    const QStringList args{
        QStringLiteral("--device"), deviceId,
        QStringLiteral("--send-sms"), body,
        QStringLiteral("--destination"), phoneNumber,
    };
    return m_launcher->run(m_cliProgram, args, kCliTimeoutMs, errorOut);
}

bool SmsSender::sendViaDbus(const QString& deviceId, const QString& phoneNumber, const QString& body,
                            QString* errorOut) const {
    return m_client->sendWithoutConversation(deviceId, {phoneNumber}, body, errorOut);
}

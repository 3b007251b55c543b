// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QCoreApplication>
#include <QDebug>
#include <KAboutData>
#include <iostream>
#include <string_view>
#include "BusConnectionPool.h"
#include "DeviceRegistry.h"
#include "ProcessLauncher.h"
#include "Settings.h"
#include "SyncEngine.h"
#include "UnixSignalHandler.h"
#include "Version.h"
#include "sms/SmsSession.h"

namespace {
    void printUsage() {
        std::cerr << "usage: linkdeck [--version] [--polling] [--sms <device-id>]" << std::endl;
    }

    void logDevices(const DeviceMap& devices) {
        qInfo() << devices.size() << "device(s)";
        for (const Device& d : devices) {
            QString battery = QStringLiteral("-");
            if (d.batteryLevel) {
                battery = QString::number(*d.batteryLevel) + QLatin1Char('%');
                if (d.isCharging.value_or(false))
                    battery += QStringLiteral(" charging");
            }
            qInfo().noquote()
                << " -" << d.id << d.name << "(" + d.type + ")"
                << "reachable=" << d.isReachable
                << "paired=" << d.isPaired
                << "battery=" << battery
                << "sms=" << d.hasSms
                << "media=" << d.hasMpris;
        }
    }

    void logConversations(const SmsSession& session) {
        const auto& conversations = session.store().conversations();
        qInfo().noquote() << conversations.size() << "conversation(s) on" << session.deviceId();
        for (const Conversation& c : conversations) {
            qInfo().noquote() << " -" << c.threadId << c.contactName << ":" << c.lastMessage;
        }
    }
}

int main(int argc, char* argv[])
{
    bool forcePolling = false;
    QString smsDeviceId;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--version") {
            std::cout << "linkdeck v" << Version::VERSION << std::endl;
            return 0;
        } else if (arg == "--polling") {
            forcePolling = true;
        } else if (arg == "--sms" && i + 1 < argc) {
            smsDeviceId = QString::fromLocal8Bit(argv[++i]);
        } else {
            printUsage();
            return 2;
        }
    }

    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("linkdeck"));

    KAboutData aboutData(
        QStringLiteral("linkdeck"),
        QStringLiteral("Linkdeck"),
        QString::fromUtf8(Version::VERSION),
        QStringLiteral("A desktop companion for phones paired through KDE Connect."),
        KAboutLicense::GPL_V3,
        QStringLiteral("(c) 2026 Reikooters &lt;https://github.com/Reikooters&gt;")
    );
    aboutData.addAuthor(QStringLiteral("Reikooters"), QStringLiteral("Developer"), QStringLiteral("https://github.com/Reikooters"));
    KAboutData::setApplicationData(aboutData);

    Settings settings = Settings::load();
    if (forcePolling)
        settings.forcePairingPolling = true;

    UnixSignalHandler signalHandler;
    {
        QString err;
        if (!signalHandler.install(&err))
            qWarning().noquote() << "Signal handlers not installed:" << err;
    }

    BusConnectionPool pool;
    QProcessLauncher launcher;

    {
        QString err;
        if (!pool.acquire(&err)) {
            qCritical().noquote() << "Cannot connect to the session bus:" << err;
            return 1;
        }
    }

    SyncEngine engine(&pool, &launcher, settings);

    QObject::connect(engine.registry(), &DeviceRegistry::refreshFinished, &app, [&engine](int) {
        logDevices(engine.devices());
    });
    QObject::connect(&engine, &SyncEngine::pairingRequested, &app, [](const PairingNotification& n) {
        qInfo().noquote() << "Pairing requested by" << n.deviceName << "(" + n.deviceType + ")" << n.deviceId;
    });
    QObject::connect(&engine, &SyncEngine::messageReceived, &app, [](const QString& deviceId, const Message& m) {
        qInfo().noquote() << "[" + deviceId + "]" << (m.isSent() ? "to" : "from") << m.address << ":" << m.body;
    });
    QObject::connect(&signalHandler, &UnixSignalHandler::shutdownRequested, &app, [&engine](int) {
        engine.shutdown();
        QCoreApplication::quit();
    });

    {
        QString err;
        if (!engine.start(&err))
            qWarning().noquote() << "Pairing detection unavailable:" << err;
        qInfo().noquote() << "Pairing detection mode:" << engine.pairingMode();
    }

    if (!smsDeviceId.isEmpty()) {
        QString err;
        SmsSession* session = engine.openSmsSession(smsDeviceId, &err);
        if (!err.isEmpty())
            qWarning().noquote() << "SMS live updates:" << err;
        QObject::connect(session, &SmsSession::conversationsChanged, &app, [session]() {
            logConversations(*session);
        });
    }

    const int rc = app.exec();
    engine.shutdown();
    return rc;
}

// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_BUSCONNECTION_H
#define LINKDECK_BUSCONNECTION_H

#include <QObject>
#include <QString>
#include <QtDBus/QDBusConnection>
#include <QtDBus/QDBusMessage>
#include <functional>
#include <memory>

// Empty fields act as wildcards, as with QDBusConnection::connect().
struct SignalMatch {
    QString service;
    QString path;
    QString interface;
    QString member;
};

using SignalHandler = std::function<void(const QDBusMessage&)>;

// A session-bus link. Implementations must allow call() from any thread.
class BusConnection {
public:
    virtual ~BusConnection() = default;

    [[nodiscard]] virtual bool isConnected() const = 0;

    // Blocking method call. Failures come back as an ErrorMessage reply.
    virtual QDBusMessage call(const QDBusMessage& message, int timeoutMs = -1) = 0;

    // The handler runs on context's thread and the subscription lives
    // exactly as long as context does.
    virtual bool subscribe(const SignalMatch& match,
                           QObject* context,
                           SignalHandler handler,
                           QString* errorOut = nullptr) = 0;
};

// BusConnection over a private, named QtDBus session connection.
class DbusSessionConnection final : public BusConnection {
public:
    static std::shared_ptr<BusConnection> open(QString* errorOut = nullptr);

    ~DbusSessionConnection() override;

    [[nodiscard]] bool isConnected() const override;

    QDBusMessage call(const QDBusMessage& message, int timeoutMs = -1) override;

    bool subscribe(const SignalMatch& match,
                   QObject* context,
                   SignalHandler handler,
                   QString* errorOut = nullptr) override;

private:
    explicit DbusSessionConnection(const QDBusConnection& connection);

    QDBusConnection m_connection;
};

// Receives signals from QtDBus and forwards them to a handler.
// Parented to the subscriber's context so QtDBus drops the match with it.
class SignalRelay final : public QObject {
    Q_OBJECT

public:
    SignalRelay(SignalHandler handler, QObject* parent);

public slots:
    void onMessage(const QDBusMessage& message);

private:
    SignalHandler m_handler;
};

#endif //LINKDECK_BUSCONNECTION_H

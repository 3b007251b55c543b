// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_TESTS_FAKEBUSCONNECTION_H
#define LINKDECK_TESTS_FAKEBUSCONNECTION_H

#include "BusConnection.h"
#include "BusConnectionPool.h"
#include "DaemonClient.h"
#include "DaemonProtocol.h"

#include <QHash>
#include <QList>
#include <QPointer>
#include <QStringList>
#include <QtDBus/QDBusMessage>
#include <QtDBus/QDBusVariant>
#include <functional>
#include <memory>
#include <mutex>

// Scripted stand-in for the session bus. Method calls are answered from
// per-method responders or a property table; everything else gets an
// UnknownMethod error. Signals are injected with deliver().
class FakeBusConnection final : public BusConnection {
public:
    using Responder = std::function<QDBusMessage(const QDBusMessage& call)>;

    bool failSubscribe = false;

    [[nodiscard]] bool isConnected() const override { return true; }

    QDBusMessage call(const QDBusMessage& message, int timeoutMs = -1) override {
        Q_UNUSED(timeoutMs);

        Responder responder;
        QVariant propertyValue;
        bool propertyFound = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_calls.push_back(message);

            const auto it = m_responders.constFind(key(message.path(), message.interface(), message.member()));
            if (it != m_responders.cend()) {
                responder = *it;
            } else if (message.interface() == QLatin1String(DaemonProtocol::kPropertiesInterface)
                       && message.member() == QLatin1String("Get")) {
                const QVariantList args = message.arguments();
                const auto p = m_properties.constFind(key(message.path(), args.value(0).toString(), args.value(1).toString()));
                if (p != m_properties.cend()) {
                    propertyValue = *p;
                    propertyFound = true;
                }
            }
        }

        if (responder)
            return responder(message);
        if (propertyFound)
            return message.createReply(QVariant::fromValue(QDBusVariant(propertyValue)));

        return message.createErrorReply(QStringLiteral("org.freedesktop.DBus.Error.UnknownMethod"),
                                        QStringLiteral("no scripted reply for %1.%2 on %3")
                                            .arg(message.interface(), message.member(), message.path()));
    }

    bool subscribe(const SignalMatch& match, QObject* context, SignalHandler handler, QString* errorOut = nullptr) override {
        if (failSubscribe) {
            if (errorOut) *errorOut = QStringLiteral("org.freedesktop.DBus.Error.AccessDenied: match rejected");
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscriptions.push_back(Subscription{match, QPointer<QObject>(context), std::move(handler)});
        return true;
    }

    // Test helpers

    void setProperty(const QString& path, const QString& interface, const QString& name, const QVariant& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_properties.insert(key(path, interface, name), value);
    }

    void setDeviceProperty(const QString& deviceId, const QString& name, const QVariant& value) {
        setProperty(DaemonClient::devicePath(deviceId), QString::fromLatin1(DaemonProtocol::kDeviceInterface), name, value);
    }

    void setResponder(const QString& path, const QString& interface, const QString& member, Responder responder) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_responders.insert(key(path, interface, member), std::move(responder));
    }

    void setReply(const QString& path, const QString& interface, const QString& member, const QVariantList& args = {}) {
        setResponder(path, interface, member, [args](const QDBusMessage& call) { return call.createReply(args); });
    }

    void setError(const QString& path, const QString& interface, const QString& member) {
        setResponder(path, interface, member, [](const QDBusMessage& call) {
            return call.createErrorReply(QStringLiteral("org.freedesktop.DBus.Error.Failed"), QStringLiteral("scripted failure"));
        });
    }

    void setDeviceList(const QStringList& ids) {
        setReply(QString::fromLatin1(DaemonProtocol::kDaemonPath), QString::fromLatin1(DaemonProtocol::kDaemonInterface),
                 QStringLiteral("devices"), {ids});
    }

    void setPlugins(const QString& deviceId, const QStringList& enabled) {
        setResponder(DaemonClient::devicePath(deviceId), QString::fromLatin1(DaemonProtocol::kDeviceInterface),
                     QStringLiteral("hasPlugin"), [enabled](const QDBusMessage& call) {
            return call.createReply(enabled.contains(call.arguments().value(0).toString()));
        });
    }

    [[nodiscard]] QList<QDBusMessage> calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

    [[nodiscard]] int callCount(const QString& member) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        int n = 0;
        for (const QDBusMessage& m : m_calls) {
            if (m.member() == member) ++n;
        }
        return n;
    }

    void clearCalls() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_calls.clear();
    }

    [[nodiscard]] int liveSubscriptions() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        int n = 0;
        for (const Subscription& s : m_subscriptions) {
            if (s.context) ++n;
        }
        return n;
    }

    static QDBusMessage makeSignal(const QString& path, const QString& interface, const QString& member,
                                   const QVariantList& args) {
        QDBusMessage signal = QDBusMessage::createSignal(path, interface, member);
        signal.setArguments(args);
        return signal;
    }

    // Hands the signal to every live subscription whose match fits.
    // Returns how many handlers ran.
    int deliver(const QDBusMessage& signal) {
        QList<SignalHandler> targets;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (const Subscription& s : m_subscriptions) {
                if (!s.context)
                    continue;
                if (!s.match.path.isEmpty() && s.match.path != signal.path())
                    continue;
                if (!s.match.interface.isEmpty() && s.match.interface != signal.interface())
                    continue;
                if (!s.match.member.isEmpty() && s.match.member != signal.member())
                    continue;
                targets.push_back(s.handler);
            }
        }

        for (const SignalHandler& h : targets)
            h(signal);
        return static_cast<int>(targets.size());
    }

private:
    struct Subscription {
        SignalMatch match;
        QPointer<QObject> context;
        SignalHandler handler;
    };

    static QString key(const QString& path, const QString& interface, const QString& member) {
        return path + QLatin1Char('|') + interface + QLatin1Char('|') + member;
    }

    mutable std::mutex m_mutex;
    QList<QDBusMessage> m_calls;
    QHash<QString, Responder> m_responders;
    QHash<QString, QVariant> m_properties;
    QList<Subscription> m_subscriptions;
};

// A pool that always hands out the given fake.
inline std::unique_ptr<BusConnectionPool> makeFakePool(const std::shared_ptr<FakeBusConnection>& bus) {
    return std::make_unique<BusConnectionPool>([bus](QString*) -> std::shared_ptr<BusConnection> { return bus; });
}

#endif //LINKDECK_TESTS_FAKEBUSCONNECTION_H

// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "DaemonClient.h"
#include "BusConnectionPool.h"
#include "DaemonProtocol.h"
#include "DbusVariantUtils.h"
#include "Utils.h"

#include <QtDBus/QDBusMessage>
#include <QtDBus/QDBusVariant>

#include <algorithm>

namespace {
    QString s(const char* latin1) {
        return QString::fromLatin1(latin1);
    }

    QString pluginObjectPath(const QString& deviceId, const char* pluginPath) {
        return DaemonClient::devicePath(deviceId) + s(pluginPath);
    }
}

DaemonClient::DaemonClient(BusConnectionPool* pool)
    : m_pool(pool) {}

QString DaemonClient::devicePath(const QString& deviceId) {
    return s(DaemonProtocol::kDevicePathPrefix) + deviceId;
}

std::optional<QString> DaemonClient::deviceIdFromPath(const QString& path) {
    const QString prefix = s(DaemonProtocol::kDevicePathPrefix);
    if (!path.startsWith(prefix))
        return std::nullopt;

    const QString id = path.mid(prefix.size()).section(QLatin1Char('/'), 0, 0);
    if (id.isEmpty())
        return std::nullopt;
    return id;
}

QString DaemonClient::mediaActionName(MediaAction action) {
    switch (action) {
        case MediaAction::Play: return QStringLiteral("Play");
        case MediaAction::Pause: return QStringLiteral("Pause");
        case MediaAction::PlayPause: return QStringLiteral("PlayPause");
        case MediaAction::Next: return QStringLiteral("Next");
        case MediaAction::Previous: return QStringLiteral("Previous");
        case MediaAction::Stop: return QStringLiteral("Stop");
    }
    return {};
}

std::optional<QVariantList> DaemonClient::invoke(const QString& path,
                                                 const QString& interface,
                                                 const QString& method,
                                                 const QVariantList& args,
                                                 QString* errorOut) const {
    if (!m_pool) {
        if (errorOut) *errorOut = QStringLiteral("No bus connection pool.");
        return std::nullopt;
    }

    const auto connection = m_pool->acquire(errorOut);
    if (!connection)
        return std::nullopt;

    QDBusMessage msg = QDBusMessage::createMethodCall(s(DaemonProtocol::kService), path, interface, method);
    msg.setArguments(args);

    const QDBusMessage reply = connection->call(msg);
    if (reply.type() == QDBusMessage::ErrorMessage) {
        if (errorOut) *errorOut = Utils::formatDbusError(reply.errorName(), reply.errorMessage());
        return std::nullopt;
    }
    if (reply.type() != QDBusMessage::ReplyMessage) {
        if (errorOut) *errorOut = QStringLiteral("%1(): no reply").arg(method);
        return std::nullopt;
    }

    return reply.arguments();
}

std::optional<QStringList> DaemonClient::deviceIds(bool onlyReachable, bool onlyPaired, QString* errorOut) const {
    const auto args = invoke(s(DaemonProtocol::kDaemonPath),
                             s(DaemonProtocol::kDaemonInterface),
                             QStringLiteral("devices"),
                             {onlyReachable, onlyPaired},
                             errorOut);
    if (!args)
        return std::nullopt;

    if (args->size() < 1) {
        if (errorOut) *errorOut = QStringLiteral("devices(): unexpected reply shape");
        return std::nullopt;
    }

    QStringList ids;
    for (const QVariant& v : DbusVariant::toListLoose(args->at(0))) {
        if (v.metaType() == QMetaType::fromType<QString>())
            ids << v.toString();
    }
    return ids;
}

std::optional<bool> DaemonClient::hasPlugin(const QString& deviceId, const QString& pluginId, QString* errorOut) const {
    const auto args = invoke(devicePath(deviceId),
                             s(DaemonProtocol::kDeviceInterface),
                             QStringLiteral("hasPlugin"),
                             {pluginId},
                             errorOut);
    if (!args)
        return std::nullopt;

    if (args->size() < 1 || args->at(0).metaType() != QMetaType::fromType<bool>()) {
        if (errorOut) *errorOut = QStringLiteral("hasPlugin(): unexpected reply shape");
        return std::nullopt;
    }
    return args->at(0).toBool();
}

std::optional<QVariant> DaemonClient::property(const QString& path,
                                               const QString& interface,
                                               const QString& name,
                                               QString* errorOut) const {
    const auto args = invoke(path,
                             s(DaemonProtocol::kPropertiesInterface),
                             QStringLiteral("Get"),
                             {interface, name},
                             errorOut);
    if (!args)
        return std::nullopt;

    if (args->size() < 1) {
        if (errorOut) *errorOut = QStringLiteral("Get(%1): unexpected reply shape").arg(name);
        return std::nullopt;
    }
    return DbusVariant::normalize(args->at(0));
}

bool DaemonClient::setProperty(const QString& path,
                               const QString& interface,
                               const QString& name,
                               const QVariant& value,
                               QString* errorOut) const {
    const auto args = invoke(path,
                             s(DaemonProtocol::kPropertiesInterface),
                             QStringLiteral("Set"),
                             {interface, name, QVariant::fromValue(QDBusVariant(value))},
                             errorOut);
    return args.has_value();
}

std::optional<QString> DaemonClient::deviceString(const QString& deviceId, const QString& name, QString* errorOut) const {
    return typedProperty<QString>(devicePath(deviceId), s(DaemonProtocol::kDeviceInterface), name, errorOut);
}

std::optional<bool> DaemonClient::deviceBool(const QString& deviceId, const QString& name, QString* errorOut) const {
    return typedProperty<bool>(devicePath(deviceId), s(DaemonProtocol::kDeviceInterface), name, errorOut);
}

std::optional<qint32> DaemonClient::deviceInt(const QString& deviceId, const QString& name, QString* errorOut) const {
    return typedProperty<qint32>(devicePath(deviceId), s(DaemonProtocol::kDeviceInterface), name, errorOut);
}

std::optional<QString> DaemonClient::pluginString(const QString& deviceId, const QString& pluginPath,
                                                  const QString& interface, const QString& name,
                                                  QString* errorOut) const {
    return typedProperty<QString>(devicePath(deviceId) + pluginPath, interface, name, errorOut);
}

std::optional<bool> DaemonClient::pluginBool(const QString& deviceId, const QString& pluginPath,
                                             const QString& interface, const QString& name,
                                             QString* errorOut) const {
    return typedProperty<bool>(devicePath(deviceId) + pluginPath, interface, name, errorOut);
}

std::optional<qint32> DaemonClient::pluginInt(const QString& deviceId, const QString& pluginPath,
                                              const QString& interface, const QString& name,
                                              QString* errorOut) const {
    return typedProperty<qint32>(devicePath(deviceId) + pluginPath, interface, name, errorOut);
}

std::optional<qint64> DaemonClient::pluginInt64(const QString& deviceId, const QString& pluginPath,
                                                const QString& interface, const QString& name,
                                                QString* errorOut) const {
    return typedProperty<qint64>(devicePath(deviceId) + pluginPath, interface, name, errorOut);
}

std::optional<QStringList> DaemonClient::pluginStringList(const QString& deviceId, const QString& pluginPath,
                                                          const QString& interface, const QString& name,
                                                          QString* errorOut) const {
    const auto v = property(devicePath(deviceId) + pluginPath, interface, name, errorOut);
    if (!v)
        return std::nullopt;

    if (!DbusVariant::isList(*v)) {
        if (errorOut) *errorOut = QStringLiteral("%1.%2: expected a string array").arg(interface, name);
        return std::nullopt;
    }

    QStringList out;
    for (const QVariant& e : v->toList()) {
        if (e.metaType() == QMetaType::fromType<QString>())
            out << e.toString();
    }
    return out;
}

bool DaemonClient::ping(const QString& deviceId, QString* errorOut) const {
    return invoke(pluginObjectPath(deviceId, DaemonProtocol::kPingPath),
                  s(DaemonProtocol::kPingInterface),
                  QStringLiteral("sendPing"), {}, errorOut).has_value();
}

bool DaemonClient::requestPairing(const QString& deviceId, QString* errorOut) const {
    return invoke(devicePath(deviceId), s(DaemonProtocol::kDeviceInterface),
                  QStringLiteral("requestPairing"), {}, errorOut).has_value();
}

bool DaemonClient::acceptPairing(const QString& deviceId, QString* errorOut) const {
    return invoke(devicePath(deviceId), s(DaemonProtocol::kDeviceInterface),
                  QStringLiteral("acceptPairing"), {}, errorOut).has_value();
}

bool DaemonClient::rejectPairing(const QString& deviceId, QString* errorOut) const {
    return invoke(devicePath(deviceId), s(DaemonProtocol::kDeviceInterface),
                  QStringLiteral("rejectPairing"), {}, errorOut).has_value();
}

bool DaemonClient::unpair(const QString& deviceId, QString* errorOut) const {
    return invoke(devicePath(deviceId), s(DaemonProtocol::kDeviceInterface),
                  QStringLiteral("unpair"), {}, errorOut).has_value();
}

bool DaemonClient::ringDevice(const QString& deviceId, QString* errorOut) const {
    return invoke(pluginObjectPath(deviceId, DaemonProtocol::kFindMyPhonePath),
                  s(DaemonProtocol::kFindMyPhoneInterface),
                  QStringLiteral("ring"), {}, errorOut).has_value();
}

bool DaemonClient::lockDevice(const QString& deviceId, QString* errorOut) const {
    return invoke(pluginObjectPath(deviceId, DaemonProtocol::kLockPath),
                  s(DaemonProtocol::kLockInterface),
                  QStringLiteral("lock"), {}, errorOut).has_value();
}

bool DaemonClient::sendClipboard(const QString& deviceId, const QString& text, QString* errorOut) const {
    return invoke(pluginObjectPath(deviceId, DaemonProtocol::kClipboardPath),
                  s(DaemonProtocol::kClipboardInterface),
                  QStringLiteral("sendClipboard"), {text}, errorOut).has_value();
}

bool DaemonClient::shareUrl(const QString& deviceId, const QString& pathOrUrl, QString* errorOut) const {
    return invoke(pluginObjectPath(deviceId, DaemonProtocol::kSharePath),
                  s(DaemonProtocol::kShareInterface),
                  QStringLiteral("shareUrl"), {Utils::toShareUrl(pathOrUrl)}, errorOut).has_value();
}

std::optional<bool> DaemonClient::sftpIsMounted(const QString& deviceId, QString* errorOut) const {
    const auto args = invoke(pluginObjectPath(deviceId, DaemonProtocol::kSftpPath),
                             s(DaemonProtocol::kSftpInterface),
                             QStringLiteral("isMounted"), {}, errorOut);
    if (!args)
        return std::nullopt;
    if (args->size() < 1 || args->at(0).metaType() != QMetaType::fromType<bool>()) {
        if (errorOut) *errorOut = QStringLiteral("isMounted(): unexpected reply shape");
        return std::nullopt;
    }
    return args->at(0).toBool();
}

bool DaemonClient::sftpMount(const QString& deviceId, QString* errorOut) const {
    return invoke(pluginObjectPath(deviceId, DaemonProtocol::kSftpPath),
                  s(DaemonProtocol::kSftpInterface),
                  QStringLiteral("mount"), {}, errorOut).has_value();
}

std::optional<QString> DaemonClient::sftpMountPoint(const QString& deviceId, QString* errorOut) const {
    const auto args = invoke(pluginObjectPath(deviceId, DaemonProtocol::kSftpPath),
                             s(DaemonProtocol::kSftpInterface),
                             QStringLiteral("mountPoint"), {}, errorOut);
    if (!args)
        return std::nullopt;
    if (args->size() < 1 || args->at(0).metaType() != QMetaType::fromType<QString>()) {
        if (errorOut) *errorOut = QStringLiteral("mountPoint(): unexpected reply shape");
        return std::nullopt;
    }
    return args->at(0).toString();
}

bool DaemonClient::sftpStartBrowsing(const QString& deviceId, QString* errorOut) const {
    return invoke(pluginObjectPath(deviceId, DaemonProtocol::kSftpPath),
                  s(DaemonProtocol::kSftpInterface),
                  QStringLiteral("startBrowsing"), {}, errorOut).has_value();
}

bool DaemonClient::setMediaPlayer(const QString& deviceId, const QString& player, QString* errorOut) const {
    return setProperty(pluginObjectPath(deviceId, DaemonProtocol::kMprisPath),
                       s(DaemonProtocol::kMprisInterface),
                       QStringLiteral("player"), player, errorOut);
}

bool DaemonClient::sendMediaAction(const QString& deviceId, MediaAction action, QString* errorOut) const {
    return invoke(pluginObjectPath(deviceId, DaemonProtocol::kMprisPath),
                  s(DaemonProtocol::kMprisInterface),
                  QStringLiteral("sendAction"), {mediaActionName(action)}, errorOut).has_value();
}

bool DaemonClient::setMediaVolume(const QString& deviceId, qint32 volume, QString* errorOut) const {
    const qint32 clamped = std::clamp(volume, 0, 100);
    return setProperty(pluginObjectPath(deviceId, DaemonProtocol::kMprisPath),
                       s(DaemonProtocol::kMprisInterface),
                       QStringLiteral("volume"), clamped, errorOut);
}

bool DaemonClient::requestAllConversationThreads(const QString& deviceId, QString* errorOut) const {
    return invoke(devicePath(deviceId), s(DaemonProtocol::kConversationsInterface),
                  QStringLiteral("requestAllConversationThreads"), {}, errorOut).has_value();
}

std::optional<QVariantList> DaemonClient::activeConversations(const QString& deviceId, QString* errorOut) const {
    const auto args = invoke(devicePath(deviceId), s(DaemonProtocol::kConversationsInterface),
                             QStringLiteral("activeConversations"), {}, errorOut);
    if (!args)
        return std::nullopt;
    if (args->size() < 1) {
        if (errorOut) *errorOut = QStringLiteral("activeConversations(): unexpected reply shape");
        return std::nullopt;
    }
    return DbusVariant::toListLoose(args->at(0));
}

bool DaemonClient::requestConversation(const QString& deviceId, qint64 threadId, qint32 start, qint32 count,
                                       QString* errorOut) const {
    return invoke(devicePath(deviceId), s(DaemonProtocol::kConversationsInterface),
                  QStringLiteral("requestConversation"),
                  {QVariant::fromValue(threadId), QVariant::fromValue(start), QVariant::fromValue(count)},
                  errorOut).has_value();
}

bool DaemonClient::sendWithoutConversation(const QString& deviceId, const QStringList& addresses,
                                           const QString& body, QString* errorOut) const {
    // (as addresses, s body, as attachmentUrls, ax subscriptionIds)
    return invoke(pluginObjectPath(deviceId, DaemonProtocol::kSmsPath),
                  s(DaemonProtocol::kConversationsInterface),
                  QStringLiteral("sendWithoutConversation"),
                  {addresses, body, QStringList{}, QVariant::fromValue(QList<qint64>{})},
                  errorOut).has_value();
}

bool DaemonClient::synchronizeContacts(const QString& deviceId, QString* errorOut) const {
    return invoke(pluginObjectPath(deviceId, DaemonProtocol::kContactsPath),
                  s(DaemonProtocol::kContactsInterface),
                  QStringLiteral("synchronizeRemoteWithLocal"), {}, errorOut).has_value();
}

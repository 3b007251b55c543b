// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_DAEMONCLIENT_H
#define LINKDECK_DAEMONCLIENT_H

#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVariantList>
#include <optional>

class BusConnectionPool;

// Synchronous calls into the KDE Connect daemon over the pooled session
// connection. Safe to use from several threads at once.
class DaemonClient {
public:
    enum class MediaAction {
        Play,
        Pause,
        PlayPause,
        Next,
        Previous,
        Stop,
    };

    explicit DaemonClient(BusConnectionPool* pool);

    [[nodiscard]] static QString devicePath(const QString& deviceId);
    // Last path segment of a device object path, if it looks like one.
    [[nodiscard]] static std::optional<QString> deviceIdFromPath(const QString& path);
    [[nodiscard]] static QString mediaActionName(MediaAction action);

    [[nodiscard]] BusConnectionPool* pool() const { return m_pool; }

    std::optional<QStringList> deviceIds(bool onlyReachable = false,
                                         bool onlyPaired = false,
                                         QString* errorOut = nullptr) const;

    std::optional<bool> hasPlugin(const QString& deviceId, const QString& pluginId, QString* errorOut = nullptr) const;

    // Properties.Get, with the result normalized to plain Qt values.
    std::optional<QVariant> property(const QString& path,
                                     const QString& interface,
                                     const QString& name,
                                     QString* errorOut = nullptr) const;

    bool setProperty(const QString& path,
                     const QString& interface,
                     const QString& name,
                     const QVariant& value,
                     QString* errorOut = nullptr) const;

    std::optional<QString> deviceString(const QString& deviceId, const QString& name, QString* errorOut = nullptr) const;
    std::optional<bool> deviceBool(const QString& deviceId, const QString& name, QString* errorOut = nullptr) const;
    std::optional<qint32> deviceInt(const QString& deviceId, const QString& name, QString* errorOut = nullptr) const;

    // pluginPath is relative to the device path, e.g. "/battery".
    std::optional<QString> pluginString(const QString& deviceId, const QString& pluginPath, const QString& interface,
                                        const QString& name, QString* errorOut = nullptr) const;
    std::optional<bool> pluginBool(const QString& deviceId, const QString& pluginPath, const QString& interface,
                                   const QString& name, QString* errorOut = nullptr) const;
    std::optional<qint32> pluginInt(const QString& deviceId, const QString& pluginPath, const QString& interface,
                                    const QString& name, QString* errorOut = nullptr) const;
    std::optional<qint64> pluginInt64(const QString& deviceId, const QString& pluginPath, const QString& interface,
                                      const QString& name, QString* errorOut = nullptr) const;
    std::optional<QStringList> pluginStringList(const QString& deviceId, const QString& pluginPath,
                                                const QString& interface, const QString& name,
                                                QString* errorOut = nullptr) const;

    // Device actions
    bool ping(const QString& deviceId, QString* errorOut = nullptr) const;
    bool requestPairing(const QString& deviceId, QString* errorOut = nullptr) const;
    bool acceptPairing(const QString& deviceId, QString* errorOut = nullptr) const;
    bool rejectPairing(const QString& deviceId, QString* errorOut = nullptr) const;
    bool unpair(const QString& deviceId, QString* errorOut = nullptr) const;
    bool ringDevice(const QString& deviceId, QString* errorOut = nullptr) const;
    bool lockDevice(const QString& deviceId, QString* errorOut = nullptr) const;
    bool sendClipboard(const QString& deviceId, const QString& text, QString* errorOut = nullptr) const;
    bool shareUrl(const QString& deviceId, const QString& pathOrUrl, QString* errorOut = nullptr) const;

    // Remote file system
    std::optional<bool> sftpIsMounted(const QString& deviceId, QString* errorOut = nullptr) const;
    bool sftpMount(const QString& deviceId, QString* errorOut = nullptr) const;
    std::optional<QString> sftpMountPoint(const QString& deviceId, QString* errorOut = nullptr) const;
    bool sftpStartBrowsing(const QString& deviceId, QString* errorOut = nullptr) const;

    // Media remote
    bool setMediaPlayer(const QString& deviceId, const QString& player, QString* errorOut = nullptr) const;
    bool sendMediaAction(const QString& deviceId, MediaAction action, QString* errorOut = nullptr) const;
    bool setMediaVolume(const QString& deviceId, qint32 volume, QString* errorOut = nullptr) const;

    // Conversations
    bool requestAllConversationThreads(const QString& deviceId, QString* errorOut = nullptr) const;
    std::optional<QVariantList> activeConversations(const QString& deviceId, QString* errorOut = nullptr) const;
    bool requestConversation(const QString& deviceId, qint64 threadId, qint32 start, qint32 count,
                             QString* errorOut = nullptr) const;
    bool sendWithoutConversation(const QString& deviceId, const QStringList& addresses, const QString& body,
                                 QString* errorOut = nullptr) const;

    bool synchronizeContacts(const QString& deviceId, QString* errorOut = nullptr) const;

    // Raw method call on the daemon service. Returns the reply arguments.
    std::optional<QVariantList> invoke(const QString& path,
                                       const QString& interface,
                                       const QString& method,
                                       const QVariantList& args = {},
                                       QString* errorOut = nullptr) const;

private:
    template <typename T>
    std::optional<T> typedProperty(const QString& path, const QString& interface, const QString& name,
                                   QString* errorOut) const {
        const std::optional<QVariant> v = property(path, interface, name, errorOut);
        if (!v)
            return std::nullopt;
        if (v->metaType() != QMetaType::fromType<T>()) {
            if (errorOut) {
                *errorOut = QStringLiteral("%1.%2: unexpected value type %3")
                                .arg(interface, name, QString::fromLatin1(v->typeName()));
            }
            return std::nullopt;
        }
        return v->value<T>();
    }

    BusConnectionPool* m_pool = nullptr;
};

#endif //LINKDECK_DAEMONCLIENT_H

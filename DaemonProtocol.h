// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_DAEMONPROTOCOL_H
#define LINKDECK_DAEMONPROTOCOL_H

// Names exported by the KDE Connect daemon on the session bus.
namespace DaemonProtocol {
    inline constexpr const char* kService = "org.kde.kdeconnect";
    inline constexpr const char* kDaemonPath = "/modules/kdeconnect";
    inline constexpr const char* kDaemonInterface = "org.kde.kdeconnect.daemon";
    inline constexpr const char* kDevicePathPrefix = "/modules/kdeconnect/devices/";

    inline constexpr const char* kDeviceInterface = "org.kde.kdeconnect.device";
    inline constexpr const char* kPropertiesInterface = "org.freedesktop.DBus.Properties";

    inline constexpr const char* kBatteryInterface = "org.kde.kdeconnect.device.battery";
    inline constexpr const char* kConnectivityInterface = "org.kde.kdeconnect.device.connectivity_report";
    inline constexpr const char* kPingInterface = "org.kde.kdeconnect.device.ping";
    inline constexpr const char* kFindMyPhoneInterface = "org.kde.kdeconnect.device.findmyphone";
    inline constexpr const char* kShareInterface = "org.kde.kdeconnect.device.share";
    inline constexpr const char* kClipboardInterface = "org.kde.kdeconnect.device.clipboard";
    inline constexpr const char* kLockInterface = "org.kde.kdeconnect.device.lockdevice";
    inline constexpr const char* kSftpInterface = "org.kde.kdeconnect.device.sftp";
    inline constexpr const char* kMprisInterface = "org.kde.kdeconnect.device.mprisremote";
    inline constexpr const char* kConversationsInterface = "org.kde.kdeconnect.device.conversations";
    inline constexpr const char* kContactsInterface = "org.kde.kdeconnect.device.contacts";

    // Plugin object paths, relative to the device path.
    inline constexpr const char* kBatteryPath = "/battery";
    inline constexpr const char* kConnectivityPath = "/connectivity_report";
    inline constexpr const char* kPingPath = "/ping";
    inline constexpr const char* kFindMyPhonePath = "/findmyphone";
    inline constexpr const char* kSharePath = "/share";
    inline constexpr const char* kClipboardPath = "/clipboard";
    inline constexpr const char* kLockPath = "/lockdevice";
    inline constexpr const char* kSftpPath = "/sftp";
    inline constexpr const char* kMprisPath = "/mprisremote";
    inline constexpr const char* kSmsPath = "/sms";
    inline constexpr const char* kContactsPath = "/contacts";

    inline constexpr const char* kPairStateChanged = "pairStateChanged";
    inline constexpr const char* kConversationUpdated = "conversationUpdated";

    // Plugin ids as reported by hasPlugin().
    inline constexpr const char* kPluginBattery = "kdeconnect_battery";
    inline constexpr const char* kPluginPing = "kdeconnect_ping";
    inline constexpr const char* kPluginShare = "kdeconnect_share";
    inline constexpr const char* kPluginFindMyPhone = "kdeconnect_findmyphone";
    inline constexpr const char* kPluginSms = "kdeconnect_sms";
    inline constexpr const char* kPluginClipboard = "kdeconnect_clipboard";
    inline constexpr const char* kPluginContacts = "kdeconnect_contacts";
    inline constexpr const char* kPluginMpris = "kdeconnect_mprisremote";
    inline constexpr const char* kPluginRemoteKeyboard = "kdeconnect_remotekeyboard";
    inline constexpr const char* kPluginSftp = "kdeconnect_sftp";
    inline constexpr const char* kPluginPresenter = "kdeconnect_presenter";
    inline constexpr const char* kPluginLockDevice = "kdeconnect_lockdevice";
    inline constexpr const char* kPluginVirtualMonitor = "kdeconnect_virtualmonitor";
    inline constexpr const char* kPluginConnectivity = "kdeconnect_connectivity_report";
    inline constexpr const char* kPluginNotifications = "kdeconnect_sendnotifications";

    inline constexpr const char* kNotificationsService = "org.freedesktop.Notifications";
    inline constexpr const char* kNotificationsPath = "/org/freedesktop/Notifications";
    inline constexpr const char* kNotificationsInterface = "org.freedesktop.Notifications";
    inline constexpr const char* kActionInvoked = "ActionInvoked";
    inline constexpr const char* kNotificationClosed = "NotificationClosed";
}

#endif //LINKDECK_DAEMONPROTOCOL_H

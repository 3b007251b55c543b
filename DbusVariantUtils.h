// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_DBUSVARIANTUTILS_H
#define LINKDECK_DBUSVARIANTUTILS_H

#include <QVariant>
#include <QVariantList>
#include <QVariantMap>

namespace DbusVariant {
    // Strips one or more QDBusVariant layers.
    QVariant unwrap(const QVariant& v);

    // Recursively turns whatever QtDBus handed us into plain Qt values:
    // structures and arrays become QVariantList, dictionaries QVariantMap,
    // and every QDBusVariant is unwrapped.
    QVariant normalize(const QVariant& v);

    // Like normalize(), but returns an empty list for anything that is not
    // list-shaped.
    QVariantList toListLoose(const QVariant& v);

    QVariantMap toMapLoose(const QVariant& v);

    [[nodiscard]] bool isList(const QVariant& v);
}

#endif //LINKDECK_DBUSVARIANTUTILS_H

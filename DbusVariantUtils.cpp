// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "DbusVariantUtils.h"

#include <QStringList>
#include <QtDBus/QDBusArgument>
#include <QtDBus/QDBusObjectPath>
#include <QtDBus/QDBusSignature>
#include <QtDBus/QDBusVariant>

namespace DbusVariant {
    namespace {
        // Nesting deeper than this is treated as garbage.
        constexpr int kMaxDepth = 32;

        QVariant normalizeImpl(const QVariant& input, int depth);

        QVariant readArgument(const QDBusArgument& a, int depth) {
            switch (a.currentType()) {
                case QDBusArgument::BasicType:
                case QDBusArgument::VariantType:
                    return normalizeImpl(a.asVariant(), depth + 1);

                case QDBusArgument::StructureType: {
                    QVariantList out;
                    a.beginStructure();
                    while (!a.atEnd()) {
                        out.push_back(readArgument(a, depth + 1));
                    }
                    a.endStructure();
                    return out;
                }

                case QDBusArgument::ArrayType: {
                    QVariantList out;
                    a.beginArray();
                    while (!a.atEnd()) {
                        out.push_back(readArgument(a, depth + 1));
                    }
                    a.endArray();
                    return out;
                }

                case QDBusArgument::MapType: {
                    QVariantMap out;
                    a.beginMap();
                    while (!a.atEnd()) {
                        a.beginMapEntry();
                        const QVariant key = readArgument(a, depth + 1);
                        const QVariant value = readArgument(a, depth + 1);
                        a.endMapEntry();
                        out.insert(key.toString(), value);
                    }
                    a.endMap();
                    return out;
                }

                case QDBusArgument::MapEntryType:
                case QDBusArgument::UnknownType:
                    break;
            }
            return {};
        }

        QVariant normalizeImpl(const QVariant& input, int depth) {
            if (depth > kMaxDepth)
                return {};

            const QVariant v = unwrap(input);
            const QMetaType type = v.metaType();

            if (type == QMetaType::fromType<QDBusArgument>()) {
                // Work on a copy, the cursor is shared state.
                const QDBusArgument a = qvariant_cast<QDBusArgument>(v);
                return readArgument(a, depth);
            }

            if (type == QMetaType::fromType<QVariantList>()) {
                QVariantList out;
                const QVariantList raw = v.toList();
                out.reserve(raw.size());
                for (const QVariant& e : raw) out.push_back(normalizeImpl(e, depth + 1));
                return out;
            }

            if (type == QMetaType::fromType<QStringList>()) {
                QVariantList out;
                const QStringList raw = v.toStringList();
                out.reserve(raw.size());
                for (const QString& s : raw) out.push_back(s);
                return out;
            }

            if (type == QMetaType::fromType<QVariantMap>()) {
                QVariantMap out;
                const QVariantMap raw = v.toMap();
                for (auto it = raw.cbegin(); it != raw.cend(); ++it)
                    out.insert(it.key(), normalizeImpl(it.value(), depth + 1));
                return out;
            }

            if (type == QMetaType::fromType<QDBusObjectPath>())
                return qvariant_cast<QDBusObjectPath>(v).path();

            if (type == QMetaType::fromType<QDBusSignature>())
                return qvariant_cast<QDBusSignature>(v).signature();

            return v;
        }
    }

    QVariant unwrap(const QVariant& v) {
        QVariant out = v;
        while (out.metaType() == QMetaType::fromType<QDBusVariant>()) {
            out = qvariant_cast<QDBusVariant>(out).variant();
        }
        return out;
    }

    QVariant normalize(const QVariant& v) {
        return normalizeImpl(v, 0);
    }

    QVariantList toListLoose(const QVariant& v) {
        const QVariant n = normalize(v);
        if (n.metaType() == QMetaType::fromType<QVariantList>())
            return n.toList();
        return {};
    }

    QVariantMap toMapLoose(const QVariant& v) {
        const QVariant n = normalize(v);
        if (n.metaType() == QMetaType::fromType<QVariantMap>())
            return n.toMap();
        return {};
    }

    bool isList(const QVariant& v) {
        return v.metaType() == QMetaType::fromType<QVariantList>();
    }
}

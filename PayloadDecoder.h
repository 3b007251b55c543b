// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_PAYLOADDECODER_H
#define LINKDECK_PAYLOADDECODER_H

#include <QMetaType>
#include <QVariant>
#include <QVariantList>
#include <initializer_list>
#include <optional>

// Typed, index-based reads from a normalized D-Bus structure.
//
// Every read is strict: the stored value must already have type T
// (an i32 is not an i64, a string is not a number). Missing indices,
// wrong types and non-list intermediates all yield the fallback.
class PayloadDecoder {
public:
    explicit PayloadDecoder(QVariantList fields);

    // Normalizes the raw signal argument first. A payload that is not
    // structure-shaped produces a decoder with no fields.
    static PayloadDecoder fromSignalArgument(const QVariant& raw);

    template <typename T>
    [[nodiscard]] T valueAt(int index, const T& fallback) const {
        return valueAtPath<T>({index}, fallback);
    }

    template <typename T>
    [[nodiscard]] T valueAtPath(std::initializer_list<int> path, const T& fallback) const {
        const std::optional<QVariant> node = nodeAt(path);
        if (!node || node->metaType() != QMetaType::fromType<T>())
            return fallback;
        return node->value<T>();
    }

    [[nodiscard]] std::optional<QVariant> nodeAt(std::initializer_list<int> path) const;

    [[nodiscard]] qsizetype size() const { return m_fields.size(); }
    [[nodiscard]] bool isEmpty() const { return m_fields.isEmpty(); }

private:
    QVariantList m_fields;
};

#endif //LINKDECK_PAYLOADDECODER_H

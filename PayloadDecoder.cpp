// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "PayloadDecoder.h"
#include "DbusVariantUtils.h"

PayloadDecoder::PayloadDecoder(QVariantList fields)
    : m_fields(std::move(fields)) {}

PayloadDecoder PayloadDecoder::fromSignalArgument(const QVariant& raw) {
    return PayloadDecoder(DbusVariant::toListLoose(raw));
}

std::optional<QVariant> PayloadDecoder::nodeAt(std::initializer_list<int> path) const {
    QVariantList level = m_fields;
    qsizetype depth = 0;
    for (const int index : path) {
        if (index < 0 || index >= level.size())
            return std::nullopt;

        const QVariant node = level.at(index);
        if (++depth == static_cast<qsizetype>(path.size()))
            return node;

        if (!DbusVariant::isList(node))
            return std::nullopt;
        level = node.toList();
    }
    return std::nullopt;
}

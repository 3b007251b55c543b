// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_UTILS_H
#define LINKDECK_UTILS_H

#include <QString>
#include <QtGlobal>

namespace Utils {
    // Milliseconds since the Unix epoch.
    qint64 nowMillis();

    QString digitsOnly(const QString& phoneNumber);

    // Loose comparison of two phone numbers as typed by humans.
    // Formatting and country prefixes are ignored; numbers shorter than
    // kMinComparableDigits have to match exactly.
    bool phoneNumbersMatch(const QString& a, const QString& b);

    inline constexpr int kMinComparableDigits = 7;
    inline constexpr int kSignificantDigits = 10;

    // "name: message", tolerating either part being empty.
    QString formatDbusError(const QString& name, const QString& message);

    // Turns a local path into a file:// URL; anything with a scheme is returned as-is.
    QString toShareUrl(const QString& pathOrUrl);
}

#endif //LINKDECK_UTILS_H

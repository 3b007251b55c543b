// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Utils.h"

#include <QDateTime>
#include <QUrl>

#include <algorithm>

namespace Utils {
    qint64 nowMillis() {
        return QDateTime::currentMSecsSinceEpoch();
    }

    QString digitsOnly(const QString& phoneNumber) {
        QString out;
        out.reserve(phoneNumber.size());
        for (const QChar c : phoneNumber) {
            if (c.isDigit())
                out.append(c);
        }
        return out;
    }

    bool phoneNumbersMatch(const QString& a, const QString& b) {
        const QString da = digitsOnly(a);
        const QString db = digitsOnly(b);
        if (da.isEmpty() || db.isEmpty())
            return false;
        if (da == db)
            return true;

        const qsizetype shortest = std::min(da.size(), db.size());
        if (shortest < kMinComparableDigits)
            return false;

        const qsizetype n = std::min<qsizetype>(shortest, kSignificantDigits);
        return da.right(n) == db.right(n);
    }

    QString formatDbusError(const QString& name, const QString& message) {
        if (message.isEmpty())
            return name.isEmpty() ? QStringLiteral("Unknown D-Bus error.") : name;
        return name.isEmpty() ? message : name + QStringLiteral(": ") + message;
    }

    QString toShareUrl(const QString& pathOrUrl) {
        if (pathOrUrl.startsWith(QLatin1Char('/')))
            return QUrl::fromLocalFile(pathOrUrl).toString();
        return pathOrUrl;
    }
}

// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "DeviceStateMerger.h"

namespace DeviceStateMerger {
    DeviceMap merge(const DeviceMap& previous, const QList<Device>& fresh) {
        DeviceMap out;
        out.reserve(fresh.size());

        for (const Device& f : fresh) {
            Device d = f;
            const auto it = previous.constFind(f.id);
            if (it != previous.cend()) {
                d.availablePlayers = it->availablePlayers;
                d.currentPlayer = it->currentPlayer;
                d.mediaInfo = it->mediaInfo;
            }
            out.insert(d.id, std::move(d));
        }

        return out;
    }
}

// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_DEVICESTATEMERGER_H
#define LINKDECK_DEVICESTATEMERGER_H

#include "Device.h"

#include <QList>

namespace DeviceStateMerger {
    // Fresh records win, except for the media session fields which are
    // carried over from previous for every id present in both. Devices that
    // only exist in previous are dropped.
    DeviceMap merge(const DeviceMap& previous, const QList<Device>& fresh);
}

#endif //LINKDECK_DEVICESTATEMERGER_H

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace DisplaySwitch {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "displayswitch.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcInventory, "displayswitch.core.inventory", QtInfoMsg)
Q_LOGGING_CATEGORY(lcTopology, "displayswitch.core.topology", QtInfoMsg)
Q_LOGGING_CATEGORY(lcApply, "displayswitch.core.apply", QtInfoMsg)

// Session and side-effect categories
Q_LOGGING_CATEGORY(lcSession, "displayswitch.session", QtInfoMsg)
Q_LOGGING_CATEGORY(lcEffects, "displayswitch.effects", QtInfoMsg)

// Daemon module categories
Q_LOGGING_CATEGORY(lcDaemon, "displayswitch.daemon", QtInfoMsg)
Q_LOGGING_CATEGORY(lcHotplug, "displayswitch.daemon.hotplug", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "displayswitch.config", QtInfoMsg)

} // namespace DisplaySwitch

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for DisplaySwitch
 *
 * Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcTopology) << "Debug message";
 *   qCWarning(lcApply) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="displayswitch.*=true"                  # Enable all
 *   QT_LOGGING_RULES="displayswitch.*.debug=false"           # Disable debug only
 *   QT_LOGGING_RULES="displayswitch.session.debug=true"      # Trace the picker singleton
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing (parsed outputs, synthesized arguments)
 *   qCInfo     - Significant operational events (layout applied, hotplug change)
 *   qCWarning  - Failed cycles, soft warnings from external tools
 *   qCCritical - Failures that keep the listener from starting
 */

namespace DisplaySwitch {

// Core module - inventory, topology resolution, apply
DISPLAYSWITCH_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
DISPLAYSWITCH_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcInventory)
DISPLAYSWITCH_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcTopology)
DISPLAYSWITCH_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcApply)

// Picker singleton and side effects
DISPLAYSWITCH_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcSession)
DISPLAYSWITCH_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcEffects)

// Daemon module - udev monitor, listener, worker
DISPLAYSWITCH_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDaemon)
DISPLAYSWITCH_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcHotplug)

// Configuration module - settings loading
DISPLAYSWITCH_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

} // namespace DisplaySwitch

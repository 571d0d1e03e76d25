// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch.h"  // Generated from displayswitch.kcfg via KConfigXT

#include <QString>
#include <QStringList>

namespace DisplaySwitch {

/**
 * @brief Provides static access to default configuration values
 *
 * Wraps the KConfigXT-generated DisplaySwitchConfig class. The .kcfg file
 * holds every default; this class only exposes the generated getters.
 *
 * Usage:
 *   QString tool = ConfigDefaults::displayTool();  // "xrandr"
 */
class ConfigDefaults
{
public:
    // ═══════════════════════════════════════════════════════════════════════════
    // Tools
    // ═══════════════════════════════════════════════════════════════════════════

    static QString displayTool() { return instance().defaultDisplayToolValue(); }
    static QString pickerProgram() { return instance().defaultPickerProgramValue(); }
    static QStringList pickerArguments() { return instance().defaultPickerArgumentsValue(); }
    static QString pickerMonitor() { return instance().defaultPickerMonitorValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Layout
    // ═══════════════════════════════════════════════════════════════════════════

    static QString homePrimaryOutput() { return instance().defaultHomePrimaryOutputValue(); }
    static QString homeSecondaryOutput() { return instance().defaultHomeSecondaryOutputValue(); }
    static QString homeSecondaryRotation() { return instance().defaultHomeSecondaryRotationValue(); }
    static QString presentationMode() { return instance().defaultPresentationModeValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Timeouts
    // ═══════════════════════════════════════════════════════════════════════════

    static int queryTimeoutMs() { return instance().defaultQueryTimeoutMsValue(); }
    static int applyTimeoutMs() { return instance().defaultApplyTimeoutMsValue(); }
    static int pickerTimeoutMs() { return instance().defaultPickerTimeoutMsValue(); }
    static int effectTimeoutMs() { return instance().defaultEffectTimeoutMsValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Hotplug
    // ═══════════════════════════════════════════════════════════════════════════

    static int debounceMs() { return instance().defaultDebounceMsValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Desktop
    // ═══════════════════════════════════════════════════════════════════════════

    static QString notificationControl() { return instance().defaultNotificationControlValue(); }
    static QString screensaverTool() { return instance().defaultScreensaverToolValue(); }
    static QString windowManagerClient() { return instance().defaultWindowManagerClientValue(); }
    static QString panelProgram() { return instance().defaultPanelProgramValue(); }
    static QString wallpaperScript() { return instance().defaultWallpaperScriptValue(); }

private:
    // Lazily-initialized singleton instance
    static DisplaySwitchConfig& instance()
    {
        static DisplaySwitchConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace DisplaySwitch

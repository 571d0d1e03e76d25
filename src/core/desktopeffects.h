// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch_export.h"
#include <QString>
#include <QStringList>

namespace DisplaySwitch {

class ICommandRunner;
class Settings;

/**
 * @brief Desktop housekeeping after a layout change
 *
 * All operations are best effort. Failures are logged and never reported
 * back to the apply cycle.
 */
class DISPLAYSWITCH_EXPORT DesktopEffects
{
public:
    DesktopEffects(ICommandRunner* runner, const Settings* settings);

    /**
     * @brief Pause notifications and the screensaver while presenting, resume otherwise
     */
    void setPresentationMode(bool presenting);

    /**
     * @brief Let the window manager pick up the new monitors and restart one panel per monitor
     */
    void refreshWindowManager();

    /**
     * @brief Re-run the wallpaper script if it exists
     */
    void restoreWallpaper();

private:
    bool runChecked(const QString& program, const QStringList& arguments, QString* output = nullptr);

    ICommandRunner* m_runner;
    const Settings* m_settings;
};

} // namespace DisplaySwitch

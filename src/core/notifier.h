// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch_export.h"
#include "interfaces.h"

namespace DisplaySwitch {

/**
 * @brief INotifier posting to org.freedesktop.Notifications on the session bus
 */
class DISPLAYSWITCH_EXPORT DesktopNotifier : public INotifier
{
public:
    DesktopNotifier() = default;
    ~DesktopNotifier() override = default;

    void notifyError(const QString& message) override;
    void notifyWarning(const QString& message) override;

private:
    static void post(const QString& summary, const QString& body, uchar urgency);
};

} // namespace DisplaySwitch

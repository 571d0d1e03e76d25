// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch_export.h"
#include "output.h"
#include "types.h"
#include <QString>

namespace DisplaySwitch {

class ICommandRunner;
class Settings;

/**
 * @brief Result of one inventory query
 */
struct DISPLAYSWITCH_EXPORT InventoryResult
{
    OutputList outputs;
    ErrorKind error = ErrorKind::None;
    QString message;

    bool isValid() const
    {
        return error == ErrorKind::None;
    }
};

/**
 * @brief Queries the display system for connected outputs
 *
 * Runs "xrandr --verbose" through the command runner and parses the report.
 * Nothing is cached: every call reflects the hardware state at that moment.
 */
class DISPLAYSWITCH_EXPORT OutputInventory
{
public:
    OutputInventory(ICommandRunner* runner, const Settings* settings);

    /**
     * @brief Connected outputs in report order
     * @return Outputs, or a QueryError if the tool failed or the report is malformed
     */
    InventoryResult listConnectedOutputs() const;

    /**
     * @brief Parse a verbose report
     *
     * Disconnected outputs are dropped. The report must contain exactly one
     * "Screen N:" header.
     */
    static InventoryResult parseVerboseReport(const QString& report);

private:
    ICommandRunner* m_runner;
    const Settings* m_settings;
};

} // namespace DisplaySwitch

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch_export.h"
#include <QByteArray>
#include <QString>

namespace DisplaySwitch {

/**
 * @brief Identification fields decoded from an EDID 1.x base block
 */
struct DISPLAYSWITCH_EXPORT EdidInfo
{
    QString manufacturerId;   ///< Three-letter PNP id, e.g. "DEL"
    QString productCode;      ///< Four hex digits
    QString serialNumber;     ///< Eight hex digits
    QString monitorName;      ///< Display product name descriptor (0xFC), may be empty

    bool isValid() const
    {
        return !manufacturerId.isEmpty();
    }

    /**
     * @brief Decode an EDID blob
     * @param raw Raw bytes, at least the 128-byte base block
     * @return Decoded fields, invalid EdidInfo if the header does not match
     */
    static EdidInfo decode(const QByteArray& raw);

    /**
     * @brief Decode the hex dump printed by "xrandr --verbose"
     */
    static EdidInfo fromHex(const QString& hex);
};

} // namespace DisplaySwitch

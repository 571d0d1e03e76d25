// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch_export.h"
#include "types.h"
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

namespace DisplaySwitch {

/**
 * @brief Named placement of an output relative to the internal panel
 */
struct DISPLAYSWITCH_EXPORT Preset
{
    QString label;
    Relation relation = Relation::LeftOf;
    ModeDirective mode;
};

namespace Presets {

/**
 * @brief All presets in the order they are offered to the picker
 *
 * left, above, left fullhd, right, same
 */
DISPLAYSWITCH_EXPORT const QVector<Preset>& all();

DISPLAYSWITCH_EXPORT QStringList labels();

/**
 * @brief Look up a preset by its exact label
 */
DISPLAYSWITCH_EXPORT std::optional<Preset> find(const QString& label);

} // namespace Presets

} // namespace DisplaySwitch

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "presets.h"

namespace DisplaySwitch {

namespace Presets {

const QVector<Preset>& all()
{
    static const QVector<Preset> presets{
        {QStringLiteral("left"), Relation::LeftOf, ModeDirective::automatic()},
        {QStringLiteral("above"), Relation::Above, ModeDirective::automatic()},
        {QStringLiteral("left fullhd"), Relation::LeftOf, ModeDirective::explicitMode(QStringLiteral("1920x1080"))},
        {QStringLiteral("right"), Relation::RightOf, ModeDirective::automatic()},
        {QStringLiteral("same"), Relation::SameAs, ModeDirective::automatic()},
    };
    return presets;
}

QStringList labels()
{
    QStringList result;
    for (const Preset& preset : all()) {
        result.append(preset.label);
    }
    return result;
}

std::optional<Preset> find(const QString& label)
{
    for (const Preset& preset : all()) {
        if (preset.label == label) {
            return preset;
        }
    }
    return std::nullopt;
}

} // namespace Presets

} // namespace DisplaySwitch

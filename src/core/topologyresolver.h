// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch_export.h"
#include "output.h"
#include "presets.h"
#include "types.h"
#include <QString>
#include <optional>

namespace DisplaySwitch {

class IOptionPicker;
class Settings;

/**
 * @brief Projector and mirror target chosen for a presentation
 */
struct DISPLAYSWITCH_EXPORT PresentationRoles
{
    QString projector;
    QString mirrorTarget;
};

/**
 * @brief Turns a selection plus the connected outputs into a layout batch
 *
 * The internal panel is the fixed anchor of every layout. Only the home
 * layout re-enables it explicitly.
 *
 * Presentation and ad-hoc placements ask the picker for a preset. A cancelled
 * preset prompt resolves to Outcome::Unchanged.
 */
class DISPLAYSWITCH_EXPORT TopologyResolver
{
public:
    TopologyResolver(IOptionPicker* picker, const Settings* settings);

    /**
     * @brief Dispatch on the selection name
     *
     * "internal", "home", "home-present" and "present" are the built-in
     * scenarios, the blank separator is no change, anything else names an output.
     */
    ResolveResult resolve(const QString& selection, const OutputList& outputs) const;

    /**
     * @brief Disable every connected output except the internal panel
     *
     * Empty batch if the panel is the only connected output.
     */
    static LayoutBatch internalOnly(const OutputList& outputs);

    /**
     * @brief Fixed three-output desk layout
     * @param present Force the presentation resolution on the primary desk output
     */
    LayoutBatch home(bool present) const;

    /**
     * @brief Projector mirroring an external display
     *
     * Fails with TopologyAmbiguous before any prompt if the outputs match
     * neither supported shape.
     */
    ResolveResult presentation(const OutputList& outputs) const;

    /**
     * @brief Place one output according to a preset chosen by the user
     */
    ResolveResult adHoc(const QString& selection) const;

    /**
     * @brief Projector/mirror assignment for a presentation
     *
     * One DisplayPort output plus HDMI: HDMI projects, the DisplayPort output
     * is mirrored. Two DisplayPort outputs without HDMI: the docked one
     * (deeper connector name) projects, the plain one is mirrored.
     *
     * @return Roles, or std::nullopt for any other set of outputs
     */
    static std::optional<PresentationRoles> assignPresentationRoles(const OutputList& outputs);

private:
    /**
     * @brief Ask for a preset
     * @param aborted Set to the cycle result when no preset was chosen
     */
    std::optional<Preset> promptPreset(ResolveResult& aborted) const;

    IOptionPicker* m_picker;
    const Settings* m_settings;
};

} // namespace DisplaySwitch

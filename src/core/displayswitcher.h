// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch_export.h"
#include "output.h"
#include "types.h"
#include <QStringList>

namespace DisplaySwitch {

class CommandSynthesizer;
class DesktopEffects;
class INotifier;
class IOptionPicker;
class OutputInventory;
class TopologyResolver;

/**
 * @brief Runs complete apply cycles
 *
 * A cycle queries the inventory, obtains a selection, resolves it to a batch,
 * applies the batch and then runs the desktop side effects. Fatal errors end
 * the cycle and are turned into a notification. Cancellation ends it quietly.
 */
class DISPLAYSWITCH_EXPORT DisplaySwitcher
{
public:
    DisplaySwitcher(OutputInventory* inventory, IOptionPicker* picker, TopologyResolver* resolver,
                    CommandSynthesizer* synthesizer, DesktopEffects* effects, INotifier* notifier);

    /**
     * @brief Options offered on the first prompt
     *
     * "internal" always; the built-in scenarios and a blank separator unless
     * the internal panel is the only output; then every other connected
     * output by its pretty name.
     */
    static QStringList selectionOptions(const OutputList& outputs);

    /**
     * @brief Query, prompt for a selection and apply it
     */
    CycleResult runInteractive();

    /**
     * @brief Apply @p selection against an already known inventory
     */
    CycleResult applySelection(const QString& selection, const OutputList& outputs);

private:
    CycleResult finish(CycleResult result);

    OutputInventory* m_inventory;
    IOptionPicker* m_picker;
    TopologyResolver* m_resolver;
    CommandSynthesizer* m_synthesizer;
    DesktopEffects* m_effects;
    INotifier* m_notifier;
};

} // namespace DisplaySwitch

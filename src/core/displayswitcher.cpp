// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "displayswitcher.h"
#include "commandsynthesizer.h"
#include "constants.h"
#include "desktopeffects.h"
#include "interfaces.h"
#include "logging.h"
#include "outputinventory.h"
#include "topologyresolver.h"

namespace DisplaySwitch {

namespace {

CycleResult failedCycle(ErrorKind error, const QString& message, const QString& selection = QString())
{
    CycleResult result;
    result.outcome = Outcome::Failed;
    result.error = error;
    result.message = message;
    result.selection = selection;
    return result;
}

} // anonymous namespace

DisplaySwitcher::DisplaySwitcher(OutputInventory* inventory, IOptionPicker* picker, TopologyResolver* resolver,
                                 CommandSynthesizer* synthesizer, DesktopEffects* effects, INotifier* notifier)
    : m_inventory(inventory)
    , m_picker(picker)
    , m_resolver(resolver)
    , m_synthesizer(synthesizer)
    , m_effects(effects)
    , m_notifier(notifier)
{
}

QStringList DisplaySwitcher::selectionOptions(const OutputList& outputs)
{
    QStringList options{Selection::Internal};
    if (!Outputs::onlyInternal(outputs)) {
        options << Selection::Home << Selection::HomePresent << Selection::Present << Selection::Separator;
    }
    for (const Output& output : outputs) {
        if (!output.isInternal()) {
            options << output.prettyName();
        }
    }
    return options;
}

CycleResult DisplaySwitcher::runInteractive()
{
    const InventoryResult inventory = m_inventory->listConnectedOutputs();
    if (!inventory.isValid()) {
        return finish(failedCycle(inventory.error, inventory.message));
    }

    const PickerResult picked = m_picker->select(selectionOptions(inventory.outputs), Prompt::Screen);
    switch (picked.status) {
    case PickerResult::Status::Cancelled:
        return finish(CycleResult());
    case PickerResult::Status::Failed:
        return finish(failedCycle(ErrorKind::PickerError, picked.error));
    case PickerResult::Status::Selected:
        break;
    }

    return applySelection(picked.selection, inventory.outputs);
}

CycleResult DisplaySwitcher::applySelection(const QString& selection, const OutputList& outputs)
{
    qCInfo(lcCore) << "Applying selection" << selection;

    const ResolveResult resolved = m_resolver->resolve(selection, outputs);
    if (resolved.outcome == Outcome::Failed) {
        return finish(failedCycle(resolved.error, resolved.message, selection));
    }

    CycleResult result;
    result.selection = selection;
    if (resolved.outcome == Outcome::Unchanged) {
        return finish(result);
    }

    const ApplyResult applied = m_synthesizer->apply(resolved.batch);
    if (!applied.isSuccess()) {
        return finish(failedCycle(applied.error, applied.message, selection));
    }

    result.outcome = Outcome::Applied;
    result.batch = resolved.batch;
    result.warning = applied.warning;

    m_effects->refreshWindowManager();
    m_effects->restoreWallpaper();
    m_effects->setPresentationMode(selection == Selection::Present || selection == Selection::HomePresent);

    return finish(result);
}

CycleResult DisplaySwitcher::finish(CycleResult result)
{
    switch (result.outcome) {
    case Outcome::Failed:
        qCWarning(lcCore) << "Cycle failed:" << errorKindName(result.error) << result.message;
        m_notifier->notifyError(result.message);
        break;
    case Outcome::Unchanged:
        qCDebug(lcCore) << "Cycle ended without a layout change";
        break;
    case Outcome::Applied:
        if (!result.warning.isEmpty()) {
            m_notifier->notifyWarning(result.warning);
        }
        break;
    }
    return result;
}

} // namespace DisplaySwitch

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "topologyresolver.h"
#include "constants.h"
#include "interfaces.h"
#include "logging.h"
#include "../config/settings.h"
#include <KLocalizedString>
#include <algorithm>

namespace DisplaySwitch {

TopologyResolver::TopologyResolver(IOptionPicker* picker, const Settings* settings)
    : m_picker(picker)
    , m_settings(settings)
{
}

ResolveResult TopologyResolver::resolve(const QString& selection, const OutputList& outputs) const
{
    if (selection == Selection::Separator) {
        qCDebug(lcTopology) << "Separator selected, nothing to do";
        return ResolveResult::unchanged();
    }
    if (selection == Selection::Internal) {
        return ResolveResult::resolved(internalOnly(outputs));
    }
    if (selection == Selection::Home) {
        return ResolveResult::resolved(home(false));
    }
    if (selection == Selection::HomePresent) {
        return ResolveResult::resolved(home(true));
    }
    if (selection == Selection::Present) {
        return presentation(outputs);
    }
    return adHoc(selection);
}

LayoutBatch TopologyResolver::internalOnly(const OutputList& outputs)
{
    LayoutBatch batch;
    for (const Output& output : outputs) {
        if (!output.isInternal()) {
            batch.append(LayoutOperation::disable(output.name));
        }
    }
    return batch;
}

LayoutBatch TopologyResolver::home(bool present) const
{
    const QString internal = OutputRoles::internalPanel();
    const QString primary = m_settings->homePrimaryOutput();
    const QString secondary = m_settings->homeSecondaryOutput();

    const ModeDirective primaryMode =
        present ? ModeDirective::explicitMode(m_settings->presentationMode()) : ModeDirective::automatic();

    LayoutOperation secondaryOp = LayoutOperation::place(secondary, Relation::LeftOf, primary);
    secondaryOp.rotation = m_settings->homeSecondaryRotation();

    return LayoutBatch{
        LayoutOperation::place(primary, Relation::LeftOf, internal, primaryMode),
        secondaryOp,
        LayoutOperation::enable(internal),
    };
}

std::optional<PresentationRoles> TopologyResolver::assignPresentationRoles(const OutputList& outputs)
{
    OutputList displayPorts;
    for (const Output& output : outputs) {
        if (output.isDisplayPort()) {
            displayPorts.append(output);
        }
    }
    const bool hasHdmi = Outputs::hasRole(outputs, OutputRole::Hdmi);

    if (displayPorts.size() == 1 && hasHdmi) {
        return PresentationRoles{OutputRoles::identity(OutputRole::Hdmi), displayPorts.first().name};
    }

    if (displayPorts.size() == 2 && !hasHdmi) {
        // Docked connectors carry an extra hyphen ("DP-1-2" vs "DP-2"). Equal
        // depths fall back to name order so the result never depends on
        // report order.
        std::sort(displayPorts.begin(), displayPorts.end(), [](const Output& a, const Output& b) {
            if (a.hierarchyDepth() != b.hierarchyDepth()) {
                return a.hierarchyDepth() > b.hierarchyDepth();
            }
            return a.name < b.name;
        });
        return PresentationRoles{displayPorts.at(0).name, displayPorts.at(1).name};
    }

    return std::nullopt;
}

ResolveResult TopologyResolver::presentation(const OutputList& outputs) const
{
    const std::optional<PresentationRoles> roles = assignPresentationRoles(outputs);
    if (!roles) {
        const QString message =
            i18n("No supported presentation setup for the connected outputs: %1", Outputs::describe(outputs));
        qCWarning(lcTopology) << message;
        return ResolveResult::failed(ErrorKind::TopologyAmbiguous, message);
    }

    ResolveResult aborted;
    const std::optional<Preset> preset = promptPreset(aborted);
    if (!preset) {
        return aborted;
    }

    qCInfo(lcTopology) << "Presenting on" << roles->projector << "mirroring" << roles->mirrorTarget << "placed"
                       << preset->label;

    return ResolveResult::resolved(LayoutBatch{
        LayoutOperation::place(roles->mirrorTarget, preset->relation, OutputRoles::internalPanel(), preset->mode),
        LayoutOperation::place(roles->projector, Relation::SameAs, roles->mirrorTarget),
    });
}

ResolveResult TopologyResolver::adHoc(const QString& selection) const
{
    const std::optional<OutputRole> role = OutputRoles::fromSelection(selection);
    const QString target = role ? OutputRoles::identity(*role) : selection;

    ResolveResult aborted;
    const std::optional<Preset> preset = promptPreset(aborted);
    if (!preset) {
        return aborted;
    }

    qCInfo(lcTopology) << "Placing" << target << preset->label << "of the internal panel";

    return ResolveResult::resolved(LayoutBatch{
        LayoutOperation::place(target, preset->relation, OutputRoles::internalPanel(), preset->mode),
    });
}

std::optional<Preset> TopologyResolver::promptPreset(ResolveResult& aborted) const
{
    aborted = ResolveResult::unchanged();

    const PickerResult picked = m_picker->select(Presets::labels(), Prompt::Config);
    if (picked.status == PickerResult::Status::Failed) {
        aborted = ResolveResult::failed(ErrorKind::PickerError, picked.error);
        return std::nullopt;
    }
    if (picked.status == PickerResult::Status::Cancelled) {
        return std::nullopt;
    }

    std::optional<Preset> preset = Presets::find(picked.selection);
    if (!preset) {
        qCInfo(lcTopology) << "Unknown preset" << picked.selection << "- leaving layout unchanged";
    }
    return preset;
}

} // namespace DisplaySwitch

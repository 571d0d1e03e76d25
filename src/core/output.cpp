// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "output.h"
#include "constants.h"

namespace DisplaySwitch {

namespace {

struct RoleEntry
{
    OutputRole role;
    QLatin1String identity;
    QLatin1String label;
};

// Connector names of the supported hardware. Labels are what the picker shows.
constexpr RoleEntry kRoleTable[] = {
    {OutputRole::Internal, QLatin1String("eDP-1"), QLatin1String("internal")},
    {OutputRole::Hdmi, QLatin1String("HDMI-1"), QLatin1String("hdmi")},
    {OutputRole::DisplayPort1, QLatin1String("DP-1"), QLatin1String("dp1")},
    {OutputRole::DisplayPort2, QLatin1String("DP-2"), QLatin1String("dp2")},
    {OutputRole::DisplayPort3, QLatin1String("DP-3"), QLatin1String("dp3")},
    {OutputRole::DisplayPort4, QLatin1String("DP-4"), QLatin1String("dp4")},
    {OutputRole::DockedDisplayPort1, QLatin1String("DP-1-1"), QLatin1String("dp_dock_1")},
    {OutputRole::DockedDisplayPort2, QLatin1String("DP-1-2"), QLatin1String("dp_dock_2")},
    {OutputRole::DockedDisplayPort3, QLatin1String("DP-1-3"), QLatin1String("dp_dock_3")},
};

const RoleEntry* findEntry(OutputRole role)
{
    for (const RoleEntry& entry : kRoleTable) {
        if (entry.role == role) {
            return &entry;
        }
    }
    return nullptr;
}

} // anonymous namespace

namespace OutputRoles {

OutputRole classify(const QString& identity)
{
    for (const RoleEntry& entry : kRoleTable) {
        if (identity == entry.identity) {
            return entry.role;
        }
    }
    return OutputRole::Unknown;
}

QString identity(OutputRole role)
{
    const RoleEntry* entry = findEntry(role);
    return entry ? QString(entry->identity) : QString();
}

QString label(OutputRole role)
{
    const RoleEntry* entry = findEntry(role);
    return entry ? QString(entry->label) : QString();
}

std::optional<OutputRole> fromSelection(const QString& selection)
{
    if (selection.isEmpty()) {
        return std::nullopt;
    }
    for (const RoleEntry& entry : kRoleTable) {
        if (selection.compare(entry.label, Qt::CaseInsensitive) == 0
            || selection.compare(entry.identity, Qt::CaseInsensitive) == 0) {
            return entry.role;
        }
    }
    return std::nullopt;
}

QString internalPanel()
{
    return identity(OutputRole::Internal);
}

} // namespace OutputRoles

Output Output::fromName(const QString& name, bool connected)
{
    Output output;
    output.name = name;
    output.role = OutputRoles::classify(name);
    output.connected = connected;
    return output;
}

bool Output::isDisplayPort() const
{
    return name.startsWith(Defaults::DisplayPortPrefix);
}

int Output::hierarchyDepth() const
{
    return static_cast<int>(name.count(QLatin1Char('-')));
}

QString Output::prettyName() const
{
    if (role != OutputRole::Unknown) {
        return OutputRoles::label(role);
    }
    return name;
}

namespace Outputs {

bool hasRole(const OutputList& outputs, OutputRole role)
{
    for (const Output& output : outputs) {
        if (output.role == role) {
            return true;
        }
    }
    return false;
}

bool onlyInternal(const OutputList& outputs)
{
    return outputs.size() == 1 && outputs.first().isInternal();
}

QString describe(const OutputList& outputs)
{
    QStringList names;
    names.reserve(outputs.size());
    for (const Output& output : outputs) {
        names.append(output.name);
    }
    return names.join(QStringLiteral(", "));
}

std::optional<Relation> observedRelation(const Output& output, const Output& anchor)
{
    const QRect& a = output.geometry;
    const QRect& b = anchor.geometry;
    if (!a.isValid() || !b.isValid()) {
        return std::nullopt;
    }

    if (a.topLeft() == b.topLeft()) {
        return Relation::SameAs;
    }
    if (a.x() + a.width() == b.x()) {
        return Relation::LeftOf;
    }
    if (b.x() + b.width() == a.x()) {
        return Relation::RightOf;
    }
    if (a.y() + a.height() == b.y()) {
        return Relation::Above;
    }
    return std::nullopt;
}

} // namespace Outputs

QDebug operator<<(QDebug debug, const Output& output)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << output.name;
    if (!output.model.isEmpty()) {
        debug << " (" << output.model << ')';
    }
    return debug;
}

} // namespace DisplaySwitch

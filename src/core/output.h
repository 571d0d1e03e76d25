// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch_export.h"
#include "types.h"
#include <QDebug>
#include <QRect>
#include <QString>
#include <QVector>
#include <optional>

namespace DisplaySwitch {

/**
 * @brief Semantic role of an output identity
 *
 * Closed set of the connector names found on the supported hardware.
 * Anything else is Unknown and keeps its raw identity in Output::name.
 */
enum class OutputRole {
    Unknown = 0,
    Internal,
    Hdmi,
    DisplayPort1,
    DisplayPort2,
    DisplayPort3,
    DisplayPort4,
    DockedDisplayPort1,
    DockedDisplayPort2,
    DockedDisplayPort3
};

/**
 * @brief Role classification table
 *
 * Lookups are pure functions of the identity string: the table is static
 * and never changes while the process runs.
 */
namespace OutputRoles {

/**
 * @brief Role for a connector name, Unknown if the name is not in the table
 */
DISPLAYSWITCH_EXPORT OutputRole classify(const QString& identity);

/**
 * @brief Connector name of a known role ("eDP-1", "DP-1-2", ...), empty for Unknown
 */
DISPLAYSWITCH_EXPORT QString identity(OutputRole role);

/**
 * @brief Short label shown in the picker ("internal", "hdmi", "dp_dock_2", ...)
 */
DISPLAYSWITCH_EXPORT QString label(OutputRole role);

/**
 * @brief Resolve a picker selection to a known role
 *
 * Matches role labels and connector names case-insensitively.
 * @return Role, or std::nullopt if the selection names no known output
 */
DISPLAYSWITCH_EXPORT std::optional<OutputRole> fromSelection(const QString& selection);

/**
 * @brief Connector name of the internal panel (the layout anchor)
 */
DISPLAYSWITCH_EXPORT QString internalPanel();

} // namespace OutputRoles

/**
 * @brief One output reported by the display system
 *
 * Constructed fresh on every inventory query and never mutated afterwards.
 */
struct DISPLAYSWITCH_EXPORT Output
{
    QString name;                      ///< Identity as reported, e.g. "DP-1-2"
    OutputRole role = OutputRole::Unknown;
    bool connected = false;
    QString model;                     ///< Monitor name from EDID, may be empty
    QRect geometry;                    ///< Current position and size, invalid if inactive

    static Output fromName(const QString& name, bool connected = true);

    bool isInternal() const
    {
        return role == OutputRole::Internal;
    }

    /**
     * @brief Whether the identity carries the DisplayPort prefix
     */
    bool isDisplayPort() const;

    /**
     * @brief Number of hyphens in the identity
     *
     * "DP-2" has one, the docked "DP-1-2" has two.
     */
    int hierarchyDepth() const;

    /**
     * @brief Label offered in the picker: role label for known outputs, raw name otherwise
     */
    QString prettyName() const;
};

using OutputList = QVector<Output>;

namespace Outputs {

DISPLAYSWITCH_EXPORT bool hasRole(const OutputList& outputs, OutputRole role);

/**
 * @brief True if the internal panel is the only connected output
 */
DISPLAYSWITCH_EXPORT bool onlyInternal(const OutputList& outputs);

/**
 * @brief Comma separated output names for diagnostics
 */
DISPLAYSWITCH_EXPORT QString describe(const OutputList& outputs);

/**
 * @brief Observed placement of @p output relative to @p anchor
 *
 * Uses the geometry read back from the display system.
 * @return Relation, or std::nullopt if either output is inactive or the
 *         geometries match none of the supported relations
 */
DISPLAYSWITCH_EXPORT std::optional<Relation> observedRelation(const Output& output, const Output& anchor);

} // namespace Outputs

DISPLAYSWITCH_EXPORT QDebug operator<<(QDebug debug, const Output& output);

} // namespace DisplaySwitch

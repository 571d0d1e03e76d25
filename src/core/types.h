// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch_export.h"
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

namespace DisplaySwitch {

/**
 * @brief Position of an output relative to a reference output
 */
enum class Relation {
    LeftOf = 0,
    Above = 1,
    RightOf = 2,
    SameAs = 3 ///< Mirror of the reference output
};

/**
 * @brief xrandr flag for a relation (e.g. "--left-of")
 */
DISPLAYSWITCH_EXPORT QString relationFlag(Relation relation);

/**
 * @brief Mode directive for one output
 *
 * Automatic picks the preferred mode, Explicit requests a named mode
 * such as "1920x1080", Off disables the output.
 */
struct DISPLAYSWITCH_EXPORT ModeDirective
{
    enum class Kind {
        Automatic = 0,
        Explicit = 1,
        Off = 2
    };

    Kind kind = Kind::Automatic;
    QString mode; ///< Only meaningful for Explicit

    static ModeDirective automatic()
    {
        return ModeDirective{Kind::Automatic, QString()};
    }
    static ModeDirective explicitMode(const QString& mode)
    {
        return ModeDirective{Kind::Explicit, mode};
    }
    static ModeDirective off()
    {
        return ModeDirective{Kind::Off, QString()};
    }

    bool operator==(const ModeDirective& other) const
    {
        return kind == other.kind && mode == other.mode;
    }
};

/**
 * @brief One output's directive within an apply batch
 *
 * Later operations in a batch may reference outputs placed by earlier ones,
 * so the batch order is significant.
 */
struct DISPLAYSWITCH_EXPORT LayoutOperation
{
    QString output;                   ///< Output identity, e.g. "DP-2"
    std::optional<Relation> relation; ///< Placement relative to reference
    QString reference;                ///< Reference output identity
    ModeDirective mode;
    QString rotation;                 ///< Empty keeps the current rotation

    /**
     * @brief Place @p output relative to @p reference
     */
    static LayoutOperation place(const QString& output, Relation relation, const QString& reference,
                                 const ModeDirective& mode = ModeDirective::automatic());

    /**
     * @brief Enable @p output without repositioning it
     */
    static LayoutOperation enable(const QString& output, const ModeDirective& mode = ModeDirective::automatic());

    /**
     * @brief Disable @p output
     */
    static LayoutOperation disable(const QString& output);

    /**
     * @brief Flag group for this operation, starting with "--output <id>"
     */
    QStringList arguments() const;

    bool operator==(const LayoutOperation& other) const
    {
        return output == other.output && relation == other.relation && reference == other.reference
            && mode == other.mode && rotation == other.rotation;
    }
};

using LayoutBatch = QVector<LayoutOperation>;

/**
 * @brief Error taxonomy of an apply cycle
 */
enum class ErrorKind {
    None = 0,
    QueryError,        ///< Output inventory could not be obtained or parsed
    TopologyAmbiguous, ///< Connected outputs match no supported scenario shape
    ApplyError,        ///< The configuration tool rejected the batch
    PickerError        ///< The picker failed for a reason other than cancellation
};

DISPLAYSWITCH_EXPORT QString errorKindName(ErrorKind kind);

/**
 * @brief Final state of one resolution or apply cycle
 */
enum class Outcome {
    Applied = 0,   ///< A batch (possibly empty) was accepted
    Unchanged = 1, ///< User or superseding session cancelled, nothing touched
    Failed = 2     ///< A fatal error aborted the cycle
};

/**
 * @brief Result of turning a selection into a layout batch
 */
struct DISPLAYSWITCH_EXPORT ResolveResult
{
    Outcome outcome = Outcome::Unchanged;
    LayoutBatch batch;
    ErrorKind error = ErrorKind::None;
    QString message;

    static ResolveResult resolved(const LayoutBatch& batch)
    {
        return ResolveResult{Outcome::Applied, batch, ErrorKind::None, QString()};
    }
    static ResolveResult unchanged()
    {
        return ResolveResult{Outcome::Unchanged, {}, ErrorKind::None, QString()};
    }
    static ResolveResult failed(ErrorKind error, const QString& message)
    {
        return ResolveResult{Outcome::Failed, {}, error, message};
    }
};

/**
 * @brief Result of one full apply cycle, as reported to the user
 */
struct DISPLAYSWITCH_EXPORT CycleResult
{
    Outcome outcome = Outcome::Unchanged;
    ErrorKind error = ErrorKind::None;
    QString selection;
    LayoutBatch batch;
    QString message; ///< Error text for Failed cycles
    QString warning; ///< Soft warning text from the configuration tool

    bool isError() const
    {
        return outcome == Outcome::Failed;
    }
};

} // namespace DisplaySwitch

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "types.h"
#include "constants.h"

namespace DisplaySwitch {

QString relationFlag(Relation relation)
{
    switch (relation) {
    case Relation::LeftOf:
        return XrandrFlag::LeftOf;
    case Relation::Above:
        return XrandrFlag::Above;
    case Relation::RightOf:
        return XrandrFlag::RightOf;
    case Relation::SameAs:
        return XrandrFlag::SameAs;
    }
    return QString();
}

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return QStringLiteral("None");
    case ErrorKind::QueryError:
        return QStringLiteral("QueryError");
    case ErrorKind::TopologyAmbiguous:
        return QStringLiteral("TopologyAmbiguous");
    case ErrorKind::ApplyError:
        return QStringLiteral("ApplyError");
    case ErrorKind::PickerError:
        return QStringLiteral("PickerError");
    }
    return QString();
}

LayoutOperation LayoutOperation::place(const QString& output, Relation relation, const QString& reference,
                                       const ModeDirective& mode)
{
    LayoutOperation op;
    op.output = output;
    op.relation = relation;
    op.reference = reference;
    op.mode = mode;
    return op;
}

LayoutOperation LayoutOperation::enable(const QString& output, const ModeDirective& mode)
{
    LayoutOperation op;
    op.output = output;
    op.mode = mode;
    return op;
}

LayoutOperation LayoutOperation::disable(const QString& output)
{
    LayoutOperation op;
    op.output = output;
    op.mode = ModeDirective::off();
    return op;
}

QStringList LayoutOperation::arguments() const
{
    QStringList args{XrandrFlag::Output, output};

    if (relation.has_value()) {
        args << relationFlag(*relation) << reference;
    }

    switch (mode.kind) {
    case ModeDirective::Kind::Automatic:
        args << XrandrFlag::Auto;
        break;
    case ModeDirective::Kind::Explicit:
        args << XrandrFlag::Mode << mode.mode;
        break;
    case ModeDirective::Kind::Off:
        args << XrandrFlag::Off;
        break;
    }

    if (!rotation.isEmpty()) {
        args << XrandrFlag::Rotate << rotation;
    }

    return args;
}

} // namespace DisplaySwitch

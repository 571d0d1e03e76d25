// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch_export.h"
#include "types.h"
#include <QString>
#include <QStringList>

namespace DisplaySwitch {

class ICommandRunner;
class Settings;

/**
 * @brief Result of applying a batch
 */
struct DISPLAYSWITCH_EXPORT ApplyResult
{
    ErrorKind error = ErrorKind::None;
    QString message; ///< Tool's error output for ApplyError
    QString warning; ///< Diagnostic text printed by a successful run

    bool isSuccess() const
    {
        return error == ErrorKind::None;
    }
};

/**
 * @brief Applies a layout batch with a single display tool invocation
 */
class DISPLAYSWITCH_EXPORT CommandSynthesizer
{
public:
    CommandSynthesizer(ICommandRunner* runner, const Settings* settings);

    /**
     * @brief Full argument list for @p batch, operations in batch order
     */
    static QStringList arguments(const LayoutBatch& batch);

    /**
     * @brief Apply @p batch
     *
     * An empty batch succeeds without running anything. A non-zero exit is an
     * ApplyError; a zero exit with error output is a success with a warning.
     */
    ApplyResult apply(const LayoutBatch& batch) const;

private:
    ICommandRunner* m_runner;
    const Settings* m_settings;
};

} // namespace DisplaySwitch

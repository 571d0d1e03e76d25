// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch_export.h"
#include "interfaces.h"

namespace DisplaySwitch {

/**
 * @brief ICommandRunner backed by QProcess
 *
 * run() blocks the calling thread. It is safe to use from any thread as long
 * as each call uses its own runner or calls are not interleaved on one thread.
 */
class DISPLAYSWITCH_EXPORT ProcessCommandRunner : public ICommandRunner
{
public:
    ProcessCommandRunner() = default;
    ~ProcessCommandRunner() override = default;

    CommandResult run(const QString& program, const QStringList& arguments, const QByteArray& input = {},
                      int timeoutMs = -1, const std::function<void(qint64)>& onStarted = {}) override;
    bool startDetached(const QString& program, const QStringList& arguments) override;
};

} // namespace DisplaySwitch

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch_export.h"
#include "interfaces.h"

namespace DisplaySwitch {

/**
 * @brief IProcessInspector reading /proc and sending POSIX signals
 */
class DISPLAYSWITCH_EXPORT ProcProcessInspector : public IProcessInspector
{
public:
    ProcProcessInspector() = default;
    ~ProcProcessInspector() override = default;

    bool isAlive(qint64 pid) const override;
    QString programName(qint64 pid) const override;
    bool terminate(qint64 pid) override;
};

} // namespace DisplaySwitch

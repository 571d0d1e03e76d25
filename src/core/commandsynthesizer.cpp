// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "commandsynthesizer.h"
#include "interfaces.h"
#include "logging.h"
#include "../config/settings.h"
#include <KLocalizedString>

namespace DisplaySwitch {

CommandSynthesizer::CommandSynthesizer(ICommandRunner* runner, const Settings* settings)
    : m_runner(runner)
    , m_settings(settings)
{
}

QStringList CommandSynthesizer::arguments(const LayoutBatch& batch)
{
    QStringList args;
    for (const LayoutOperation& op : batch) {
        args << op.arguments();
    }
    return args;
}

ApplyResult CommandSynthesizer::apply(const LayoutBatch& batch) const
{
    ApplyResult result;
    if (batch.isEmpty()) {
        qCDebug(lcApply) << "Empty batch, display configuration left as is";
        return result;
    }

    const QString tool = m_settings->displayTool();
    const QStringList args = arguments(batch);
    qCInfo(lcApply) << "Applying" << tool << args;

    const CommandResult run = m_runner->run(tool, args, QByteArray(), m_settings->applyTimeoutMs());
    const QString errorOutput = run.standardError.trimmed();

    if (!run.started) {
        result.error = ErrorKind::ApplyError;
        result.message = i18n("Could not run %1: %2", tool, run.errorString);
    } else if (run.timedOut) {
        result.error = ErrorKind::ApplyError;
        result.message = i18n("%1 did not finish in time", tool);
    } else if (run.crashed || run.exitCode != 0) {
        result.error = ErrorKind::ApplyError;
        result.message = i18n("%1 rejected the configuration (exit code %2)\n%3", tool, run.exitCode, errorOutput);
    } else if (!errorOutput.isEmpty()) {
        result.warning = errorOutput;
        qCWarning(lcApply) << tool << "reported:" << errorOutput;
    }

    if (!result.isSuccess()) {
        qCWarning(lcApply) << result.message;
    }
    return result;
}

} // namespace DisplaySwitch

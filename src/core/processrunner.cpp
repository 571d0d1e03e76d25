// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "processrunner.h"
#include "constants.h"
#include "logging.h"
#include <QProcess>

namespace DisplaySwitch {

CommandResult ProcessCommandRunner::run(const QString& program, const QStringList& arguments,
                                        const QByteArray& input, int timeoutMs,
                                        const std::function<void(qint64)>& onStarted)
{
    CommandResult result;
    QProcess process;

    qCDebug(lcCore) << "Running" << program << arguments;

    process.start(program, arguments);

    if (!process.waitForStarted(Defaults::StartTimeoutMs)) {
        result.errorString = process.errorString();
        qCWarning(lcCore) << "Failed to start" << program << ":" << result.errorString;
        return result;
    }
    result.started = true;

    if (onStarted) {
        onStarted(process.processId());
    }

    if (!input.isEmpty()) {
        process.write(input);
        if (!process.waitForBytesWritten(timeoutMs)) {
            qCDebug(lcCore) << program << "did not consume its input:" << process.errorString();
        }
    }
    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs) && process.state() != QProcess::NotRunning) {
        // SIGTERM first, SIGKILL after the grace period
        process.terminate();
        if (!process.waitForFinished(Defaults::TerminateGraceMs)) {
            process.kill();
            process.waitForFinished(Defaults::TerminateGraceMs);
        }
        result.timedOut = true;
        qCWarning(lcCore) << program << "timed out after" << timeoutMs << "ms";
    }

    result.crashed = !result.timedOut && process.exitStatus() == QProcess::CrashExit;
    result.exitCode = process.exitCode();
    result.standardOutput = QString::fromUtf8(process.readAllStandardOutput());
    result.standardError = QString::fromUtf8(process.readAllStandardError());

    if (result.crashed) {
        qCDebug(lcCore) << program << "ended by a signal";
    } else if (!result.timedOut && result.exitCode != 0) {
        qCDebug(lcCore) << program << "exited with" << result.exitCode;
    }

    return result;
}

bool ProcessCommandRunner::startDetached(const QString& program, const QStringList& arguments)
{
    qCDebug(lcCore) << "Launching detached" << program << arguments;
    if (!QProcess::startDetached(program, arguments)) {
        qCWarning(lcCore) << "Failed to launch" << program;
        return false;
    }
    return true;
}

} // namespace DisplaySwitch

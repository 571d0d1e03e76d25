// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sessioncoordinator.h"
#include "constants.h"
#include "logging.h"
#include "../config/settings.h"
#include <KLocalizedString>
#include <QFileInfo>
#include <QMutexLocker>
#include <QScopeGuard>

namespace DisplaySwitch {

SessionCoordinator::SessionCoordinator(ICommandRunner* runner, ISessionStore* store, IProcessInspector* inspector,
                                       const Settings* settings, QObject* parent)
    : QObject(parent)
    , m_runner(runner)
    , m_store(store)
    , m_inspector(inspector)
    , m_settings(settings)
{
}

SessionCoordinator::State SessionCoordinator::state() const
{
    QMutexLocker lock(&m_mutex);
    return m_state;
}

void SessionCoordinator::setState(State state)
{
    {
        QMutexLocker lock(&m_mutex);
        if (m_state == state) {
            return;
        }
        m_state = state;
    }
    Q_EMIT stateChanged(state);
}

void SessionCoordinator::releaseIfHeldBy(qint64 pid)
{
    // A newer session may have claimed the marker in the meantime
    if (m_store->currentHolder() == pid) {
        m_store->release();
    }
}

SessionCoordinator::TerminateOutcome SessionCoordinator::terminateActive()
{
    const std::optional<qint64> holder = m_store->currentHolder();
    if (!holder) {
        return TerminateOutcome::NoSession;
    }

    const qint64 pid = *holder;
    const QString expected = QFileInfo(m_settings->pickerProgram()).fileName();

    if (!m_inspector->isAlive(pid) || m_inspector->programName(pid) != expected) {
        qCDebug(lcSession) << "Discarding stale session marker for pid" << pid;
        releaseIfHeldBy(pid);
        return TerminateOutcome::StaleMarker;
    }

    State previous;
    {
        QMutexLocker lock(&m_mutex);
        previous = m_state;
        m_state = State::Terminating;
    }
    if (previous != State::Terminating) {
        Q_EMIT stateChanged(State::Terminating);
    }

    qCInfo(lcSession) << "Terminating picker" << pid;
    if (!m_inspector->terminate(pid)) {
        qCWarning(lcSession) << "Could not signal picker" << pid;
    }
    releaseIfHeldBy(pid);

    // select() on another thread may have finished meanwhile and moved to Idle
    bool restored = false;
    {
        QMutexLocker lock(&m_mutex);
        if (m_state == State::Terminating) {
            m_state = previous;
            restored = previous != State::Terminating;
        }
    }
    if (restored) {
        Q_EMIT stateChanged(previous);
    }
    return TerminateOutcome::Terminated;
}

QStringList SessionCoordinator::pickerArguments(const QString& prompt) const
{
    QStringList args = m_settings->pickerArguments();
    args << Defaults::PickerPromptFlag << prompt;
    if (!m_settings->pickerMonitor().isEmpty()) {
        args << QStringLiteral("-m") << m_settings->pickerMonitor();
    }
    return args;
}

PickerResult SessionCoordinator::select(const QStringList& options, const QString& prompt)
{
    setState(State::Launching);
    terminateActive();

    auto cleanup = qScopeGuard([this]() {
        qint64 own = 0;
        {
            QMutexLocker lock(&m_mutex);
            own = m_activePid;
            m_activePid = 0;
        }
        if (own > 0) {
            releaseIfHeldBy(own);
        }
        setState(State::Idle);
    });

    const QString program = m_settings->pickerProgram();
    const QByteArray input = options.join(QLatin1Char('\n')).toUtf8();

    const CommandResult result = m_runner->run(
        program, pickerArguments(prompt), input, m_settings->pickerTimeoutMs(), [this](qint64 pid) {
            {
                QMutexLocker lock(&m_mutex);
                m_activePid = pid;
            }
            if (!m_store->claim(pid)) {
                qCWarning(lcSession) << "Could not record session marker for pid" << pid;
            }
            setState(State::Active);
        });

    return interpret(result, program);
}

PickerResult SessionCoordinator::interpret(const CommandResult& result, const QString& program)
{
    if (!result.started) {
        return PickerResult::failed(i18n("Could not run %1: %2", program, result.errorString));
    }

    // Exit code 1 and any forced end of the picker count as no choice
    if (result.timedOut || result.crashed || result.exitCode == Defaults::PickerCancelExitCode) {
        qCDebug(lcSession) << "Picker closed without a selection";
        return PickerResult::cancelled();
    }

    if (result.exitCode != 0) {
        return PickerResult::failed(
            i18n("Error selecting option: %1 returned %2\n%3", program, result.exitCode, result.standardError.trimmed()));
    }

    return PickerResult::selected(result.standardOutput.trimmed());
}

} // namespace DisplaySwitch

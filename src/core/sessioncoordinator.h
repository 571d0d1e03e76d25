// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch_export.h"
#include "interfaces.h"
#include <QMutex>
#include <QObject>

namespace DisplaySwitch {

class Settings;

/**
 * @brief Owns the picker process and keeps at most one alive system wide
 *
 * Before a picker is launched, any picker recorded in the session marker is
 * terminated. The new picker's pid is then claimed in the marker and
 * released again when it exits, whatever the exit path.
 *
 * select() blocks and is meant to run on the interactive worker thread;
 * terminateActive() may be called from any thread.
 */
class DISPLAYSWITCH_EXPORT SessionCoordinator : public QObject, public IOptionPicker
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Launching,
        Active,
        Terminating
    };
    Q_ENUM(State)

    enum class TerminateOutcome {
        NoSession,   ///< No marker present
        Terminated,  ///< A live picker was signalled
        StaleMarker  ///< Marker named a dead or foreign process, discarded without signal
    };
    Q_ENUM(TerminateOutcome)

    SessionCoordinator(ICommandRunner* runner, ISessionStore* store, IProcessInspector* inspector,
                       const Settings* settings, QObject* parent = nullptr);
    ~SessionCoordinator() override = default;

    PickerResult select(const QStringList& options, const QString& prompt) override;

    /**
     * @brief Terminate the picker named by the session marker, if any
     *
     * The marker is removed unless a newer session claimed it while the
     * picker was being signalled. The state returns to what it was before,
     * unless the interrupted select() already moved it on.
     */
    TerminateOutcome terminateActive();

    State state() const;

Q_SIGNALS:
    void stateChanged(DisplaySwitch::SessionCoordinator::State state);

private:
    void setState(State state);
    void releaseIfHeldBy(qint64 pid);
    QStringList pickerArguments(const QString& prompt) const;
    static PickerResult interpret(const CommandResult& result, const QString& program);

    ICommandRunner* m_runner;
    ISessionStore* m_store;
    IProcessInspector* m_inspector;
    const Settings* m_settings;

    mutable QMutex m_mutex;
    State m_state = State::Idle;
    qint64 m_activePid = 0;
};

} // namespace DisplaySwitch

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch_export.h"
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <functional>
#include <optional>

namespace DisplaySwitch {

/**
 * @brief Outcome of one blocking external program invocation
 */
struct DISPLAYSWITCH_EXPORT CommandResult
{
    bool started = false;   ///< false if the program could not be launched at all
    bool timedOut = false;  ///< Bounded wait expired and the process was terminated
    bool crashed = false;   ///< Process ended by a signal
    int exitCode = -1;
    QString standardOutput;
    QString standardError;
    QString errorString;    ///< Launch failure description

    bool succeeded() const
    {
        return started && !timedOut && !crashed && exitCode == 0;
    }
};

/**
 * @brief Abstract interface for running external programs
 *
 * Every interaction with the display system, the picker and the desktop
 * helpers goes through this seam so tests can substitute canned results.
 */
class DISPLAYSWITCH_EXPORT ICommandRunner
{
public:
    virtual ~ICommandRunner();

    /**
     * @brief Run @p program to completion
     * @param input Bytes written to the child's stdin, stdin is closed afterwards
     * @param timeoutMs Upper bound on the run time, -1 waits indefinitely
     * @param onStarted Called with the child's pid once it is running
     */
    virtual CommandResult run(const QString& program, const QStringList& arguments, const QByteArray& input = {},
                              int timeoutMs = -1, const std::function<void(qint64)>& onStarted = {}) = 0;

    /**
     * @brief Launch @p program without waiting for it
     * @return true if the program was started
     */
    virtual bool startDetached(const QString& program, const QStringList& arguments) = 0;
};

/**
 * @brief Result of presenting a list of options to the user
 */
struct DISPLAYSWITCH_EXPORT PickerResult
{
    enum class Status {
        Selected = 0,
        Cancelled = 1, ///< User aborted, or the session was superseded
        Failed = 2
    };

    Status status = Status::Cancelled;
    QString selection;
    QString error;

    static PickerResult selected(const QString& selection)
    {
        return PickerResult{Status::Selected, selection, QString()};
    }
    static PickerResult cancelled()
    {
        return PickerResult{Status::Cancelled, QString(), QString()};
    }
    static PickerResult failed(const QString& error)
    {
        return PickerResult{Status::Failed, QString(), error};
    }
};

/**
 * @brief Abstract interface for the interactive option picker
 */
class DISPLAYSWITCH_EXPORT IOptionPicker
{
public:
    virtual ~IOptionPicker();

    /**
     * @brief Show @p options with @p prompt and wait for a choice
     */
    virtual PickerResult select(const QStringList& options, const QString& prompt) = 0;
};

/**
 * @brief Persistent record of the process currently holding the picker session
 */
class DISPLAYSWITCH_EXPORT ISessionStore
{
public:
    virtual ~ISessionStore();

    /**
     * @brief Pid recorded in the marker, std::nullopt if absent or unreadable
     */
    virtual std::optional<qint64> currentHolder() const = 0;

    /**
     * @brief Record @p pid as the session holder, replacing any previous record
     */
    virtual bool claim(qint64 pid) = 0;

    /**
     * @brief Remove the marker
     */
    virtual void release() = 0;
};

/**
 * @brief Access to other processes on the system
 */
class DISPLAYSWITCH_EXPORT IProcessInspector
{
public:
    virtual ~IProcessInspector();

    virtual bool isAlive(qint64 pid) const = 0;

    /**
     * @brief Executable base name of @p pid, empty if unknown
     */
    virtual QString programName(qint64 pid) const = 0;

    /**
     * @brief Send the termination signal to @p pid
     */
    virtual bool terminate(qint64 pid) = 0;
};

/**
 * @brief User-visible reporting of failed or degraded cycles
 */
class DISPLAYSWITCH_EXPORT INotifier
{
public:
    virtual ~INotifier();

    virtual void notifyError(const QString& message) = 0;
    virtual void notifyWarning(const QString& message) = 0;
};

} // namespace DisplaySwitch

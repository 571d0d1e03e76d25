// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/types.h"
#include <QObject>
#include <atomic>

namespace DisplaySwitch {

class DisplaySwitcher;

/**
 * @brief Runs interactive cycles on the thread it lives on
 *
 * Move it to a dedicated QThread so the blocking picker never stalls the
 * hotplug listener. At most one cycle is queued at any time; requests made
 * while one is already queued are dropped.
 */
class InteractiveWorker : public QObject
{
    Q_OBJECT

public:
    explicit InteractiveWorker(DisplaySwitcher* switcher, QObject* parent = nullptr);
    ~InteractiveWorker() override = default;

    /**
     * @brief Queue a cycle, callable from any thread
     * @return false if a cycle was already queued
     */
    bool schedule();

    bool isPending() const
    {
        return m_pending.load();
    }

Q_SIGNALS:
    void cycleFinished(DisplaySwitch::Outcome outcome);

private Q_SLOTS:
    void runCycle();

private:
    DisplaySwitcher* m_switcher;
    std::atomic<bool> m_pending{false};
};

} // namespace DisplaySwitch

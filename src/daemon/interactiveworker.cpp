// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interactiveworker.h"
#include "../core/displayswitcher.h"
#include "../core/logging.h"
#include <QMetaObject>

namespace DisplaySwitch {

InteractiveWorker::InteractiveWorker(DisplaySwitcher* switcher, QObject* parent)
    : QObject(parent)
    , m_switcher(switcher)
{
}

bool InteractiveWorker::schedule()
{
    if (m_pending.exchange(true)) {
        qCDebug(lcDaemon) << "Interactive cycle already queued";
        return false;
    }
    QMetaObject::invokeMethod(this, &InteractiveWorker::runCycle, Qt::QueuedConnection);
    return true;
}

void InteractiveWorker::runCycle()
{
    // Cleared before running: an event during this cycle may queue the next one
    m_pending.store(false);

    qCDebug(lcDaemon) << "Starting interactive cycle";
    const CycleResult result = m_switcher->runInteractive();
    Q_EMIT cycleFinished(result.outcome);
}

} // namespace DisplaySwitch

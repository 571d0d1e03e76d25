// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "hotplugservice.h"
#include "hotpluglistener.h"
#include "interactiveworker.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include "../core/sessioncoordinator.h"

namespace DisplaySwitch {

HotplugService::HotplugService(OutputInventory* inventory, SessionCoordinator* coordinator,
                               DisplaySwitcher* switcher, INotifier* notifier, const Settings* settings,
                               QObject* parent)
    : QObject(parent)
    , m_coordinator(coordinator)
    , m_listener(std::make_unique<HotplugListener>(inventory, coordinator, switcher, notifier, settings))
    , m_worker(new InteractiveWorker(switcher))
{
    m_worker->moveToThread(&m_workerThread);
    connect(&m_workerThread, &QThread::finished, m_worker, &QObject::deleteLater);
    m_workerThread.setObjectName(QStringLiteral("InteractiveWorker"));

    connect(m_worker, &InteractiveWorker::cycleFinished, this, &HotplugService::cycleFinished);
}

HotplugService::~HotplugService()
{
    stop();
    // Still set only if the thread never started and cannot run deleteLater
    delete m_worker;
}

void HotplugService::start()
{
    if (m_running) {
        return;
    }

    // schedule() is thread-safe and only queues onto the worker thread
    m_requestConnection =
        connect(m_listener.get(), &HotplugListener::interactiveCycleRequested, this, [this]() {
            m_worker->schedule();
        });
    m_workerThread.start();
    m_running = true;
}

void HotplugService::stop()
{
    if (!m_running) {
        return;
    }
    m_running = false;

    disconnect(m_requestConnection);
    m_listener->cancelPendingChange();

    // Close a picker the worker may be blocked on so the thread can finish
    m_coordinator->terminateActive();
    m_workerThread.quit();
    while (!m_workerThread.wait(Defaults::WorkerStopPollMs)) {
        if (m_coordinator->terminateActive() == SessionCoordinator::TerminateOutcome::Terminated) {
            qCDebug(lcDaemon) << "Closed a picker opened during shutdown";
        }
    }
    m_worker = nullptr;
}

void HotplugService::notifyDeviceChanged()
{
    if (m_running) {
        m_listener->scheduleChange();
    }
}

} // namespace DisplaySwitch

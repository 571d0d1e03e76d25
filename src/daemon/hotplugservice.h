// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/types.h"
#include <QObject>
#include <QThread>
#include <memory>

namespace DisplaySwitch {

class DisplaySwitcher;
class HotplugListener;
class INotifier;
class InteractiveWorker;
class OutputInventory;
class SessionCoordinator;
class Settings;

/**
 * @brief Listener mode: hotplug handling plus the interactive worker thread
 *
 * The listener runs on the owner's thread. Interactive cycles it requests
 * are handed to an InteractiveWorker living on a dedicated QThread, so a
 * blocking picker never delays the next hotplug event.
 *
 * The event source is not owned here; connect it to notifyDeviceChanged().
 */
class HotplugService : public QObject
{
    Q_OBJECT

public:
    HotplugService(OutputInventory* inventory, SessionCoordinator* coordinator, DisplaySwitcher* switcher,
                   INotifier* notifier, const Settings* settings, QObject* parent = nullptr);
    ~HotplugService() override;

    void start();

    /**
     * @brief Stop handling events and join the worker thread
     *
     * An open picker is terminated. The picker is signalled again while the
     * thread drains, so one launched during shutdown does not keep it alive
     * until the picker timeout.
     */
    void stop();

    bool isRunning() const
    {
        return m_running;
    }

    HotplugListener* listener() const
    {
        return m_listener.get();
    }

    InteractiveWorker* worker() const
    {
        return m_worker;
    }

public Q_SLOTS:
    void notifyDeviceChanged();

Q_SIGNALS:
    /**
     * @brief An interactive cycle ended on the worker thread
     */
    void cycleFinished(DisplaySwitch::Outcome outcome);

private:
    SessionCoordinator* m_coordinator;
    std::unique_ptr<HotplugListener> m_listener;
    InteractiveWorker* m_worker = nullptr; // owned by m_workerThread once moved
    QThread m_workerThread;
    QMetaObject::Connection m_requestConnection;
    bool m_running = false;
};

} // namespace DisplaySwitch

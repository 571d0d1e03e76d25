// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "hotpluglistener.h"
#include "../config/settings.h"
#include "../core/constants.h"
#include "../core/displayswitcher.h"
#include "../core/interfaces.h"
#include "../core/logging.h"
#include "../core/outputinventory.h"
#include "../core/sessioncoordinator.h"

namespace DisplaySwitch {

HotplugListener::HotplugListener(OutputInventory* inventory, SessionCoordinator* coordinator,
                                 DisplaySwitcher* switcher, INotifier* notifier, const Settings* settings,
                                 QObject* parent)
    : QObject(parent)
    , m_inventory(inventory)
    , m_coordinator(coordinator)
    , m_switcher(switcher)
    , m_notifier(notifier)
    , m_settings(settings)
{
    m_debounceTimer.setSingleShot(true);
    connect(&m_debounceTimer, &QTimer::timeout, this, &HotplugListener::handleChange);
}

void HotplugListener::scheduleChange()
{
    // Restarting the timer folds a burst of events into one query
    m_debounceTimer.start(m_settings->debounceMs());
}

void HotplugListener::handleChange()
{
    const InventoryResult inventory = m_inventory->listConnectedOutputs();
    if (!inventory.isValid()) {
        qCWarning(lcHotplug) << "Ignoring change, inventory unavailable:" << inventory.message;
        m_notifier->notifyError(inventory.message);
        return;
    }

    qCInfo(lcHotplug) << "Detected change, now connected:" << inventory.outputs;

    m_coordinator->terminateActive();

    if (Outputs::onlyInternal(inventory.outputs)) {
        m_switcher->applySelection(Selection::Internal, inventory.outputs);
        return;
    }

    Q_EMIT interactiveCycleRequested();
}

} // namespace DisplaySwitch

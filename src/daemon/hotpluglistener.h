// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <QTimer>

namespace DisplaySwitch {

class DisplaySwitcher;
class INotifier;
class OutputInventory;
class SessionCoordinator;
class Settings;

/**
 * @brief Reacts to display hotplug events
 *
 * Bursts of events are coalesced by a debounce timer. After each burst the
 * inventory is queried again. With only the internal panel left, any open
 * picker is closed and the internal-only layout is applied right away.
 * Otherwise any open picker is closed and an interactive cycle is requested.
 *
 * Errors are logged and notified; the listener keeps running.
 */
class HotplugListener : public QObject
{
    Q_OBJECT

public:
    HotplugListener(OutputInventory* inventory, SessionCoordinator* coordinator, DisplaySwitcher* switcher,
                    INotifier* notifier, const Settings* settings, QObject* parent = nullptr);
    ~HotplugListener() override = default;

    bool isChangePending() const
    {
        return m_debounceTimer.isActive();
    }

    void cancelPendingChange()
    {
        m_debounceTimer.stop();
    }

public Q_SLOTS:
    /**
     * @brief Note a hardware change, handled once the debounce period elapses
     */
    void scheduleChange();

    /**
     * @brief Re-derive the inventory and act on it immediately
     */
    void handleChange();

Q_SIGNALS:
    /**
     * @brief External outputs are connected and the user should pick a layout
     */
    void interactiveCycleRequested();

private:
    OutputInventory* m_inventory;
    SessionCoordinator* m_coordinator;
    DisplaySwitcher* m_switcher;
    INotifier* m_notifier;
    const Settings* m_settings;

    QTimer m_debounceTimer;
};

} // namespace DisplaySwitch

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/types.h"
#include <QObject>
#include <memory>

namespace DisplaySwitch {

class CommandSynthesizer;
class DesktopEffects;
class DesktopNotifier;
class DisplaySwitcher;
class HotplugService;
class OutputInventory;
class PidFileSessionStore;
class ProcProcessInspector;
class ProcessCommandRunner;
class SessionCoordinator;
class Settings;
class TopologyResolver;
class UdevMonitor;

/**
 * @brief Wires the display switching components together
 *
 * runOnce() performs a single interactive cycle on the calling thread.
 * startListening() subscribes to hotplug events and hands interactive cycles
 * to a worker thread until stop() is called.
 *
 * Note: This class does NOT use the singleton pattern. main() owns the instance.
 */
class Daemon : public QObject
{
    Q_OBJECT

public:
    explicit Daemon(QObject* parent = nullptr);
    ~Daemon() override;

    CycleResult runOnce();

    /**
     * @brief Start the hotplug listener
     * @return false if the udev subscription could not be set up
     */
    bool startListening();
    void stop();

private:
    std::unique_ptr<Settings> m_settings;
    std::unique_ptr<ProcessCommandRunner> m_runner;
    std::unique_ptr<PidFileSessionStore> m_sessionStore;
    std::unique_ptr<ProcProcessInspector> m_processInspector;
    std::unique_ptr<DesktopNotifier> m_notifier;
    std::unique_ptr<SessionCoordinator> m_coordinator;
    std::unique_ptr<OutputInventory> m_inventory;
    std::unique_ptr<TopologyResolver> m_resolver;
    std::unique_ptr<CommandSynthesizer> m_synthesizer;
    std::unique_ptr<DesktopEffects> m_effects;
    std::unique_ptr<DisplaySwitcher> m_switcher;

    // Listener mode only
    std::unique_ptr<UdevMonitor> m_udevMonitor;
    std::unique_ptr<HotplugService> m_hotplug;
};

} // namespace DisplaySwitch

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"
#include "hotplugservice.h"
#include "udevmonitor.h"
#include "../config/settings.h"
#include "../core/commandsynthesizer.h"
#include "../core/desktopeffects.h"
#include "../core/displayswitcher.h"
#include "../core/logging.h"
#include "../core/notifier.h"
#include "../core/outputinventory.h"
#include "../core/processinspector.h"
#include "../core/processrunner.h"
#include "../core/sessioncoordinator.h"
#include "../core/sessionstore.h"
#include "../core/topologyresolver.h"

namespace DisplaySwitch {

Daemon::Daemon(QObject* parent)
    : QObject(parent)
    , m_settings(std::make_unique<Settings>())
    , m_runner(std::make_unique<ProcessCommandRunner>())
    , m_sessionStore(std::make_unique<PidFileSessionStore>())
    , m_processInspector(std::make_unique<ProcProcessInspector>())
    , m_notifier(std::make_unique<DesktopNotifier>())
{
    m_coordinator = std::make_unique<SessionCoordinator>(m_runner.get(), m_sessionStore.get(),
                                                         m_processInspector.get(), m_settings.get());
    m_inventory = std::make_unique<OutputInventory>(m_runner.get(), m_settings.get());
    m_resolver = std::make_unique<TopologyResolver>(m_coordinator.get(), m_settings.get());
    m_synthesizer = std::make_unique<CommandSynthesizer>(m_runner.get(), m_settings.get());
    m_effects = std::make_unique<DesktopEffects>(m_runner.get(), m_settings.get());
    m_switcher = std::make_unique<DisplaySwitcher>(m_inventory.get(), m_coordinator.get(), m_resolver.get(),
                                                   m_synthesizer.get(), m_effects.get(), m_notifier.get());
}

Daemon::~Daemon()
{
    stop();
}

CycleResult Daemon::runOnce()
{
    return m_switcher->runInteractive();
}

bool Daemon::startListening()
{
    if (m_hotplug) {
        return true;
    }

    m_udevMonitor = std::make_unique<UdevMonitor>(QStringLiteral("drm"));
    if (!m_udevMonitor->start()) {
        m_udevMonitor.reset();
        return false;
    }

    m_hotplug = std::make_unique<HotplugService>(m_inventory.get(), m_coordinator.get(), m_switcher.get(),
                                                 m_notifier.get(), m_settings.get());
    connect(m_udevMonitor.get(), &UdevMonitor::deviceChanged, m_hotplug.get(), &HotplugService::notifyDeviceChanged);
    connect(m_hotplug.get(), &HotplugService::cycleFinished, this, [](Outcome outcome) {
        qCDebug(lcDaemon) << "Interactive cycle finished" << (outcome == Outcome::Failed ? "with an error" : "");
    });
    m_hotplug->start();
    return true;
}

void Daemon::stop()
{
    if (!m_hotplug) {
        return;
    }

    m_udevMonitor.reset();
    m_hotplug->stop();
    m_hotplug.reset();
}

} // namespace DisplaySwitch

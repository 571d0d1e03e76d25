// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "udevmonitor.h"
#include "../core/logging.h"
#include <QSocketNotifier>

#include <libudev.h>

namespace DisplaySwitch {

UdevMonitor::UdevMonitor(const QString& subsystem, QObject* parent)
    : QObject(parent)
    , m_subsystem(subsystem)
{
}

UdevMonitor::~UdevMonitor()
{
    stop();
}

bool UdevMonitor::start()
{
    if (isRunning()) {
        return true;
    }

    m_udev = udev_new();
    if (!m_udev) {
        qCCritical(lcHotplug) << "Failed to create udev context";
        return false;
    }

    m_monitor = udev_monitor_new_from_netlink(m_udev, "udev");
    if (!m_monitor) {
        qCCritical(lcHotplug) << "Failed to open udev monitor";
        stop();
        return false;
    }

    const QByteArray subsystem = m_subsystem.toLatin1();
    if (udev_monitor_filter_add_match_subsystem_devtype(m_monitor, subsystem.constData(), nullptr) < 0) {
        qCCritical(lcHotplug) << "Failed to filter udev events on" << m_subsystem;
        stop();
        return false;
    }

    if (udev_monitor_enable_receiving(m_monitor) < 0) {
        qCCritical(lcHotplug) << "Failed to enable udev event reception";
        stop();
        return false;
    }

    const int fd = udev_monitor_get_fd(m_monitor);
    m_notifier = std::make_unique<QSocketNotifier>(fd, QSocketNotifier::Read);
    connect(m_notifier.get(), &QSocketNotifier::activated, this, &UdevMonitor::readEvents);

    qCInfo(lcHotplug) << "Listening for" << m_subsystem << "events";
    return true;
}

void UdevMonitor::stop()
{
    m_notifier.reset();
    if (m_monitor) {
        udev_monitor_unref(m_monitor);
        m_monitor = nullptr;
    }
    if (m_udev) {
        udev_unref(m_udev);
        m_udev = nullptr;
    }
}

void UdevMonitor::readEvents()
{
    // Drain everything queued on the socket, one notifier wakeup can cover several events
    while (udev_device* device = udev_monitor_receive_device(m_monitor)) {
        const char* action = udev_device_get_action(device);
        const char* sysname = udev_device_get_sysname(device);
        const QString actionName = action ? QString::fromLatin1(action) : QString();
        const QString deviceName = sysname ? QString::fromLatin1(sysname) : QString();
        udev_device_unref(device);

        qCDebug(lcHotplug) << "udev" << actionName << deviceName;
        Q_EMIT deviceChanged(actionName, deviceName);
    }
}

} // namespace DisplaySwitch

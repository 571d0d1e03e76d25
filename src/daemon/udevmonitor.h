// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <QString>
#include <memory>

struct udev;
struct udev_monitor;
class QSocketNotifier;

namespace DisplaySwitch {

/**
 * @brief Watches udev for events of one subsystem
 *
 * The netlink socket is driven by a QSocketNotifier on the owning thread's
 * event loop, so no thread of its own is needed.
 */
class UdevMonitor : public QObject
{
    Q_OBJECT

public:
    explicit UdevMonitor(const QString& subsystem, QObject* parent = nullptr);
    ~UdevMonitor() override;

    /**
     * @brief Open the monitor and start receiving events
     * @return false if udev is unavailable, details are logged
     */
    bool start();
    void stop();

    bool isRunning() const
    {
        return m_notifier != nullptr;
    }

Q_SIGNALS:
    /**
     * @brief A device of the subsystem changed
     * @param action udev action ("change", "add", "remove")
     * @param sysname Kernel name of the device, e.g. "card0"
     */
    void deviceChanged(const QString& action, const QString& sysname);

private:
    void readEvents();

    QString m_subsystem;
    udev* m_udev = nullptr;
    udev_monitor* m_monitor = nullptr;
    std::unique_ptr<QSocketNotifier> m_notifier;
};

} // namespace DisplaySwitch

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "processinspector.h"
#include "logging.h"
#include <QFile>
#include <QFileInfo>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/types.h>

namespace DisplaySwitch {

bool ProcProcessInspector::isAlive(qint64 pid) const
{
    if (pid <= 0) {
        return false;
    }
    // Signal 0 only checks existence; EPERM means it exists under another user
    return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

QString ProcProcessInspector::programName(qint64 pid) const
{
    QFile cmdline(QStringLiteral("/proc/%1/cmdline").arg(pid));
    if (!cmdline.open(QIODevice::ReadOnly)) {
        return QString();
    }

    // argv entries are NUL separated
    const QByteArray contents = cmdline.readAll();
    const QByteArray argv0 = contents.split('\0').value(0);
    return QFileInfo(QString::fromLocal8Bit(argv0)).fileName();
}

bool ProcProcessInspector::terminate(qint64 pid)
{
    if (pid <= 0) {
        return false;
    }
    if (::kill(static_cast<pid_t>(pid), SIGTERM) != 0) {
        // ESRCH: it exited on its own in the meantime
        if (errno != ESRCH) {
            qCWarning(lcSession) << "Failed to signal" << pid << ":" << std::strerror(errno);
        }
        return false;
    }
    return true;
}

} // namespace DisplaySwitch

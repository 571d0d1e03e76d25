// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sessionstore.h"
#include "constants.h"
#include "logging.h"
#include <QDir>
#include <QFile>
#include <QStandardPaths>

namespace DisplaySwitch {

PidFileSessionStore::PidFileSessionStore(const QString& path)
    : m_path(path.isEmpty() ? defaultPath() : path)
{
}

QString PidFileSessionStore::defaultPath()
{
    QString runtimeDir = QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    if (runtimeDir.isEmpty()) {
        runtimeDir = QDir::tempPath();
        qCWarning(lcSession) << "No runtime directory, keeping the session marker in" << runtimeDir;
    }
    return QDir(runtimeDir).filePath(Defaults::SessionMarkerFileName);
}

std::optional<qint64> PidFileSessionStore::currentHolder() const
{
    QFile file(m_path);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }

    bool ok = false;
    const qint64 pid = QString::fromLatin1(file.readAll()).trimmed().toLongLong(&ok);
    if (!ok || pid <= 0) {
        qCDebug(lcSession) << "Ignoring unreadable session marker" << m_path;
        return std::nullopt;
    }
    return pid;
}

bool PidFileSessionStore::claim(qint64 pid)
{
    QFile file(m_path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCWarning(lcSession) << "Failed to write session marker" << m_path << ":" << file.errorString();
        return false;
    }
    if (file.write(QByteArray::number(pid)) < 0) {
        qCWarning(lcSession) << "Failed to write session marker" << m_path << ":" << file.errorString();
        return false;
    }
    file.close();
    qCDebug(lcSession) << "Session marker now holds" << pid;
    return true;
}

void PidFileSessionStore::release()
{
    if (QFile::exists(m_path) && !QFile::remove(m_path)) {
        qCWarning(lcSession) << "Failed to remove session marker" << m_path;
    }
}

} // namespace DisplaySwitch

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch_export.h"
#include "interfaces.h"
#include <QString>

namespace DisplaySwitch {

/**
 * @brief ISessionStore backed by a pid file in the runtime directory
 *
 * The file holds the decimal pid of the running picker. There is no locking:
 * two claimants racing between check and write can both succeed.
 */
class DISPLAYSWITCH_EXPORT PidFileSessionStore : public ISessionStore
{
public:
    /**
     * @param path Marker location, defaults to $XDG_RUNTIME_DIR/displayswitch.pid
     */
    explicit PidFileSessionStore(const QString& path = QString());
    ~PidFileSessionStore() override = default;

    std::optional<qint64> currentHolder() const override;
    bool claim(qint64 pid) override;
    void release() override;

    QString path() const
    {
        return m_path;
    }

    static QString defaultPath();

private:
    QString m_path;
};

} // namespace DisplaySwitch

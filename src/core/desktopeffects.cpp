// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "desktopeffects.h"
#include "interfaces.h"
#include "logging.h"
#include "../config/settings.h"
#include <QFileInfo>

namespace DisplaySwitch {

DesktopEffects::DesktopEffects(ICommandRunner* runner, const Settings* settings)
    : m_runner(runner)
    , m_settings(settings)
{
}

bool DesktopEffects::runChecked(const QString& program, const QStringList& arguments, QString* output)
{
    const CommandResult result = m_runner->run(program, arguments, QByteArray(), m_settings->effectTimeoutMs());
    if (!result.succeeded()) {
        qCWarning(lcEffects) << program << arguments << "failed:"
                             << (result.started ? result.standardError.trimmed() : result.errorString);
        return false;
    }
    if (output) {
        *output = result.standardOutput;
    }
    return true;
}

void DesktopEffects::setPresentationMode(bool presenting)
{
    qCInfo(lcEffects) << "Presentation mode" << (presenting ? "on" : "off");

    runChecked(m_settings->notificationControl(),
               {QStringLiteral("set-paused"), presenting ? QStringLiteral("true") : QStringLiteral("false")});
    runChecked(m_settings->screensaverTool(),
               {QStringLiteral("s"), presenting ? QStringLiteral("off") : QStringLiteral("default")});
}

void DesktopEffects::refreshWindowManager()
{
    const QString client = m_settings->windowManagerClient();
    runChecked(client, {QStringLiteral("detect_monitors")});
    runChecked(client, {QStringLiteral("emit_hook"), QStringLiteral("quit_panel")});

    QString monitors;
    if (!runChecked(client, {QStringLiteral("list_monitors")}, &monitors)) {
        return;
    }

    // "0: 1920x1080+0+0 with tag 1 [FOCUS]"
    const QStringList lines = monitors.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString& line : lines) {
        const QString monitorId = line.section(QLatin1Char(':'), 0, 0).trimmed();
        if (monitorId.isEmpty()) {
            continue;
        }
        if (!m_runner->startDetached(m_settings->panelProgram(), {monitorId})) {
            qCWarning(lcEffects) << "Panel for monitor" << monitorId << "not started";
        }
    }
}

void DesktopEffects::restoreWallpaper()
{
    const QString script = m_settings->wallpaperScript();
    if (!QFileInfo(script).isFile()) {
        qCDebug(lcEffects) << "No wallpaper script at" << script;
        return;
    }
    runChecked(script, {});
}

} // namespace DisplaySwitch

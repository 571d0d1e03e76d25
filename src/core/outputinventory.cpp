// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "outputinventory.h"
#include "constants.h"
#include "edid.h"
#include "interfaces.h"
#include "logging.h"
#include "../config/settings.h"
#include <KLocalizedString>
#include <QRegularExpression>

namespace DisplaySwitch {

namespace {

const QRegularExpression kScreenHeader(QStringLiteral("^Screen \\d+:"));

// "DP-1-2 connected primary 2560x1440+1920+0 (0x4a) normal (...) 597mm x 336mm"
const QRegularExpression kOutputHeader(
    QStringLiteral("^(\\S+) (connected|disconnected|unknown connection)(?: primary)?"
                   "(?: (\\d+)x(\\d+)\\+(-?\\d+)\\+(-?\\d+))?"));

const QRegularExpression kEdidHeader(QStringLiteral("^\\s+EDID:\\s*$"));
const QRegularExpression kHexLine(QStringLiteral("^\\s+([0-9a-fA-F]+)\\s*$"));

QString failureMessage(const QString& tool, const CommandResult& result)
{
    if (!result.started) {
        return i18n("Could not run %1: %2", tool, result.errorString);
    }
    if (result.timedOut) {
        return i18n("%1 did not answer in time", tool);
    }
    const QString details = result.standardError.trimmed();
    return i18n("%1 failed with exit code %2\n%3", tool, result.exitCode, details);
}

} // anonymous namespace

OutputInventory::OutputInventory(ICommandRunner* runner, const Settings* settings)
    : m_runner(runner)
    , m_settings(settings)
{
}

InventoryResult OutputInventory::listConnectedOutputs() const
{
    const QString tool = m_settings->displayTool();
    const CommandResult result =
        m_runner->run(tool, {XrandrFlag::Verbose}, QByteArray(), m_settings->queryTimeoutMs());

    if (!result.succeeded()) {
        InventoryResult failed;
        failed.error = ErrorKind::QueryError;
        failed.message = failureMessage(tool, result);
        qCWarning(lcInventory) << "Output query failed:" << failed.message;
        return failed;
    }

    InventoryResult inventory = parseVerboseReport(result.standardOutput);
    if (inventory.isValid()) {
        qCDebug(lcInventory) << "Connected outputs:" << inventory.outputs;
    } else {
        qCWarning(lcInventory) << "Unusable output report:" << inventory.message;
    }
    return inventory;
}

InventoryResult OutputInventory::parseVerboseReport(const QString& report)
{
    InventoryResult inventory;
    const QStringList lines = report.split(QLatin1Char('\n'));

    int screens = 0;
    Output current;
    bool haveCurrent = false;
    bool readingEdid = false;
    QString edidHex;

    auto finishCurrent = [&]() {
        if (!haveCurrent) {
            return;
        }
        if (!edidHex.isEmpty()) {
            const EdidInfo edid = EdidInfo::fromHex(edidHex);
            if (edid.isValid()) {
                current.model = edid.monitorName;
            }
        }
        if (current.connected) {
            inventory.outputs.append(current);
        }
        haveCurrent = false;
        readingEdid = false;
        edidHex.clear();
    };

    for (const QString& line : lines) {
        if (kScreenHeader.match(line).hasMatch()) {
            finishCurrent();
            ++screens;
            continue;
        }

        const QRegularExpressionMatch header = kOutputHeader.match(line);
        if (header.hasMatch()) {
            finishCurrent();
            current = Output::fromName(header.captured(1), header.captured(2) == QLatin1String("connected"));
            if (header.hasCaptured(3)) {
                current.geometry = QRect(header.captured(5).toInt(), header.captured(6).toInt(),
                                         header.captured(3).toInt(), header.captured(4).toInt());
            }
            haveCurrent = true;
            continue;
        }

        if (!haveCurrent) {
            continue;
        }

        if (kEdidHeader.match(line).hasMatch()) {
            readingEdid = true;
            continue;
        }
        if (readingEdid) {
            const QRegularExpressionMatch hex = kHexLine.match(line);
            if (hex.hasMatch()) {
                edidHex += hex.captured(1);
            } else {
                readingEdid = false;
            }
        }
    }
    finishCurrent();

    if (screens != 1) {
        InventoryResult malformed;
        malformed.error = ErrorKind::QueryError;
        malformed.message = i18n("Unexpected output report: expected exactly one screen, found %1", screens);
        return malformed;
    }

    return inventory;
}

} // namespace DisplaySwitch

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/logging.h"
#include <QDir>
#include <QRegularExpression>

namespace DisplaySwitch {

namespace {
// xrandr mode names look like "1920x1080"
const QRegularExpression kModePattern(QStringLiteral("^\\d+x\\d+$"));
const QStringList kRotations{QStringLiteral("normal"), QStringLiteral("left"), QStringLiteral("right"),
                             QStringLiteral("inverted")};
}

Settings::Settings(QObject* parent)
    : Settings(KSharedConfig::openConfig(QStringLiteral("displayswitchrc")), parent)
{
}

Settings::Settings(KSharedConfig::Ptr config, QObject* parent)
    : QObject(parent)
    , m_config(std::move(config))
{
    load();
}

int Settings::readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                               const char* settingName)
{
    int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

QString Settings::readNonEmptyString(const KConfigGroup& group, const char* key, const QString& defaultValue,
                                     const char* settingName)
{
    const QString value = group.readEntry(QLatin1String(key), defaultValue).trimmed();
    if (value.isEmpty()) {
        qCWarning(lcConfig) << "Empty" << settingName << "- using default" << defaultValue;
        return defaultValue;
    }
    return value;
}

QString Settings::resolveHomePath(const QString& path)
{
    if (path.startsWith(QLatin1String("~/"))) {
        return QDir::home().filePath(path.mid(2));
    }
    if (QDir::isRelativePath(path)) {
        return QDir::home().filePath(path);
    }
    return path;
}

void Settings::load()
{
    // KSharedConfig caches in memory, force a re-read from disk
    m_config->reparseConfiguration();

    KConfigGroup tools = m_config->group(QStringLiteral("Tools"));
    KConfigGroup layout = m_config->group(QStringLiteral("Layout"));
    KConfigGroup timeouts = m_config->group(QStringLiteral("Timeouts"));
    KConfigGroup hotplug = m_config->group(QStringLiteral("Hotplug"));
    KConfigGroup desktop = m_config->group(QStringLiteral("Desktop"));

    // Tools
    m_displayTool = readNonEmptyString(tools, "DisplayTool", ConfigDefaults::displayTool(), "display tool");
    m_pickerProgram = readNonEmptyString(tools, "PickerProgram", ConfigDefaults::pickerProgram(), "picker program");
    m_pickerArguments = tools.readEntry(QLatin1String("PickerArguments"), ConfigDefaults::pickerArguments());
    m_pickerMonitor = tools.readEntry(QLatin1String("PickerMonitor"), ConfigDefaults::pickerMonitor()).trimmed();

    // Layout
    m_homePrimaryOutput =
        readNonEmptyString(layout, "HomePrimaryOutput", ConfigDefaults::homePrimaryOutput(), "home primary output");
    m_homeSecondaryOutput = readNonEmptyString(layout, "HomeSecondaryOutput", ConfigDefaults::homeSecondaryOutput(),
                                               "home secondary output");

    m_homeSecondaryRotation =
        layout.readEntry(QLatin1String("HomeSecondaryRotation"), ConfigDefaults::homeSecondaryRotation()).trimmed();
    if (!m_homeSecondaryRotation.isEmpty() && !kRotations.contains(m_homeSecondaryRotation)) {
        qCWarning(lcConfig) << "Invalid home secondary rotation:" << m_homeSecondaryRotation << "using default";
        m_homeSecondaryRotation = ConfigDefaults::homeSecondaryRotation();
    }

    m_presentationMode = layout.readEntry(QLatin1String("PresentationMode"), ConfigDefaults::presentationMode());
    if (!kModePattern.match(m_presentationMode).hasMatch()) {
        qCWarning(lcConfig) << "Invalid presentation mode:" << m_presentationMode << "using default";
        m_presentationMode = ConfigDefaults::presentationMode();
    }

    // Timeouts
    m_queryTimeoutMs =
        readValidatedInt(timeouts, "QueryTimeoutMs", ConfigDefaults::queryTimeoutMs(), 100, 120000, "query timeout");
    m_applyTimeoutMs =
        readValidatedInt(timeouts, "ApplyTimeoutMs", ConfigDefaults::applyTimeoutMs(), 100, 120000, "apply timeout");
    m_pickerTimeoutMs = readValidatedInt(timeouts, "PickerTimeoutMs", ConfigDefaults::pickerTimeoutMs(), 1000,
                                         3600000, "picker timeout");
    m_effectTimeoutMs =
        readValidatedInt(timeouts, "EffectTimeoutMs", ConfigDefaults::effectTimeoutMs(), 100, 60000, "effect timeout");

    // Hotplug
    m_debounceMs = readValidatedInt(hotplug, "DebounceMs", ConfigDefaults::debounceMs(), 0, 10000, "hotplug debounce");

    // Desktop
    m_notificationControl = readNonEmptyString(desktop, "NotificationControl",
                                               ConfigDefaults::notificationControl(), "notification control");
    m_screensaverTool =
        readNonEmptyString(desktop, "ScreensaverTool", ConfigDefaults::screensaverTool(), "screensaver tool");
    m_windowManagerClient = readNonEmptyString(desktop, "WindowManagerClient",
                                               ConfigDefaults::windowManagerClient(), "window manager client");
    m_panelProgram = readNonEmptyString(desktop, "PanelProgram", ConfigDefaults::panelProgram(), "panel program");
    m_wallpaperScript = resolveHomePath(
        readNonEmptyString(desktop, "WallpaperScript", ConfigDefaults::wallpaperScript(), "wallpaper script"));

    qCDebug(lcConfig) << "Loaded settings: tool" << m_displayTool << "picker" << m_pickerProgram << m_pickerArguments
                      << "debounce" << m_debounceMs << "ms";

    Q_EMIT settingsChanged();
}

} // namespace DisplaySwitch

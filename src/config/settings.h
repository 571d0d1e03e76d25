// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "displayswitch_export.h"
#include <KConfigGroup>
#include <KSharedConfig>
#include <QObject>
#include <QString>
#include <QStringList>

namespace DisplaySwitch {

/**
 * @brief Runtime configuration read from displayswitchrc
 *
 * Values are validated on load; out-of-range numbers fall back to the
 * .kcfg defaults with a warning.
 *
 * Note: This class does NOT use the singleton pattern. Create one instance
 * in main() and pass it to the components that need it.
 */
class DISPLAYSWITCH_EXPORT Settings : public QObject
{
    Q_OBJECT

    Q_PROPERTY(QString displayTool READ displayTool NOTIFY settingsChanged)
    Q_PROPERTY(QString pickerProgram READ pickerProgram NOTIFY settingsChanged)
    Q_PROPERTY(int debounceMs READ debounceMs NOTIFY settingsChanged)

public:
    /**
     * @brief Settings backed by the user's displayswitchrc
     */
    explicit Settings(QObject* parent = nullptr);

    /**
     * @brief Settings backed by an explicit config object (used by tests)
     */
    explicit Settings(KSharedConfig::Ptr config, QObject* parent = nullptr);
    ~Settings() override = default;

    /**
     * @brief Re-read all values from disk
     */
    void load();

    // Tools
    QString displayTool() const
    {
        return m_displayTool;
    }
    QString pickerProgram() const
    {
        return m_pickerProgram;
    }
    QStringList pickerArguments() const
    {
        return m_pickerArguments;
    }
    QString pickerMonitor() const
    {
        return m_pickerMonitor;
    }

    // Layout
    QString homePrimaryOutput() const
    {
        return m_homePrimaryOutput;
    }
    QString homeSecondaryOutput() const
    {
        return m_homeSecondaryOutput;
    }
    QString homeSecondaryRotation() const
    {
        return m_homeSecondaryRotation;
    }
    QString presentationMode() const
    {
        return m_presentationMode;
    }

    // Timeouts
    int queryTimeoutMs() const
    {
        return m_queryTimeoutMs;
    }
    int applyTimeoutMs() const
    {
        return m_applyTimeoutMs;
    }
    int pickerTimeoutMs() const
    {
        return m_pickerTimeoutMs;
    }
    int effectTimeoutMs() const
    {
        return m_effectTimeoutMs;
    }

    // Hotplug
    int debounceMs() const
    {
        return m_debounceMs;
    }

    // Desktop
    QString notificationControl() const
    {
        return m_notificationControl;
    }
    QString screensaverTool() const
    {
        return m_screensaverTool;
    }
    QString windowManagerClient() const
    {
        return m_windowManagerClient;
    }
    QString panelProgram() const
    {
        return m_panelProgram;
    }

    /**
     * @brief Absolute path of the wallpaper restore script
     */
    QString wallpaperScript() const
    {
        return m_wallpaperScript;
    }

Q_SIGNALS:
    void settingsChanged();

private:
    static int readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                                const char* settingName);
    static QString readNonEmptyString(const KConfigGroup& group, const char* key, const QString& defaultValue,
                                      const char* settingName);
    static QString resolveHomePath(const QString& path);

    KSharedConfig::Ptr m_config;

    QString m_displayTool;
    QString m_pickerProgram;
    QStringList m_pickerArguments;
    QString m_pickerMonitor;

    QString m_homePrimaryOutput;
    QString m_homeSecondaryOutput;
    QString m_homeSecondaryRotation;
    QString m_presentationMode;

    int m_queryTimeoutMs = 0;
    int m_applyTimeoutMs = 0;
    int m_pickerTimeoutMs = 0;
    int m_effectTimeoutMs = 0;

    int m_debounceMs = 0;

    QString m_notificationControl;
    QString m_screensaverTool;
    QString m_windowManagerClient;
    QString m_panelProgram;
    QString m_wallpaperScript;
};

} // namespace DisplaySwitch

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "notifier.h"
#include "constants.h"
#include "logging.h"
#include <KLocalizedString>
#include <QDBusConnection>
#include <QDBusMessage>
#include <QVariantMap>

namespace DisplaySwitch {

void DesktopNotifier::notifyError(const QString& message)
{
    post(i18n("Screen Configuration Error"), message, Notification::UrgencyCritical);
}

void DesktopNotifier::notifyWarning(const QString& message)
{
    post(i18n("Screen Configuration Warning"), message, Notification::UrgencyNormal);
}

void DesktopNotifier::post(const QString& summary, const QString& body, uchar urgency)
{
    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        qCWarning(lcEffects) << "No session bus, dropping notification:" << summary << body;
        return;
    }

    QDBusMessage msg = QDBusMessage::createMethodCall(Notification::Service, Notification::Path,
                                                      Notification::Interface, QStringLiteral("Notify"));

    QVariantMap hints;
    hints[QStringLiteral("urgency")] = QVariant::fromValue(urgency);

    msg << QString(Notification::AppName) // app_name
        << 0u // replaces_id
        << QString(Notification::AppIcon) // app_icon
        << summary << body
        << QStringList() // actions
        << hints
        << -1; // expire_timeout

    const QDBusMessage reply = bus.call(msg, QDBus::Block, Notification::CallTimeoutMs);
    if (reply.type() == QDBusMessage::ErrorMessage) {
        qCWarning(lcEffects) << "Failed to send notification:" << reply.errorMessage();
    }
}

} // namespace DisplaySwitch

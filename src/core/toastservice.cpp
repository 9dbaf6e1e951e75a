// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "toastservice.h"
#include "logging.h"
#include <KLocalizedString>
#include <QDBusConnection>
#include <QDBusMessage>

namespace PaneSync {

ToastService::ToastService(QObject* parent)
    : INotifier(parent)
{
}

void ToastService::showError(const QString& title, const QString& message)
{
    qCInfo(lcApp) << "Toast:" << title << "-" << message;
    Q_EMIT toastRequested(title, message);

    if (!m_usePlasmaOsd) {
        return;
    }

    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        qCDebug(lcApp) << "No session bus, OSD toast skipped";
        return;
    }

    // Use KDE Plasma's OSD service for a text-only notification
    QDBusMessage msg = QDBusMessage::createMethodCall(QStringLiteral("org.kde.plasmashell"),
                                                      QStringLiteral("/org/kde/osdService"),
                                                      QStringLiteral("org.kde.osdService"), QStringLiteral("showText"));
    msg << QStringLiteral("dialog-error") << i18nc("@info:osd title: message", "%1: %2", title, message);
    bus.asyncCall(msg);
}

} // namespace PaneSync

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include "../sync/eventtransport.h"
#include <QDBusConnection>
#include <QString>

namespace PaneSync {

/**
 * @brief Event bus over D-Bus broadcast signals
 *
 * Publishing emits org.panesync.Sync.event(channel, payload) on /PaneSync,
 * where payload is a compact JSON object. Every window matches that signal
 * from any sender, so a publish reaches every live window including this
 * one. Delivery and ordering are whatever the bus daemon provides; the
 * transport adds no acknowledgements or retries.
 *
 * Payloads that are not JSON objects are dropped with a warning.
 */
class PANESYNC_EXPORT DBusEventTransport : public EventTransport
{
    Q_OBJECT

public:
    /**
     * @param windowLabel Identity attached by callers to every outgoing message
     * @param connection Bus to use; normally the session bus
     */
    explicit DBusEventTransport(const QString& windowLabel,
                                const QDBusConnection& connection = QDBusConnection::sessionBus(),
                                QObject* parent = nullptr);
    ~DBusEventTransport() override;

    bool isAvailable() const override
    {
        return m_subscribed;
    }
    QString windowLabel() const override
    {
        return m_windowLabel;
    }
    bool publish(const QString& channel, const QJsonObject& payload) override;

    using EventTransport::publish;

private Q_SLOTS:
    void onEvent(const QString& channel, const QString& payload);

private:
    QDBusConnection m_connection;
    QString m_windowLabel;
    bool m_subscribed = false;
};

} // namespace PaneSync

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dbuseventtransport.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include <QDBusMessage>
#include <QJsonDocument>
#include <QJsonParseError>

namespace PaneSync {

DBusEventTransport::DBusEventTransport(const QString& windowLabel, const QDBusConnection& connection,
                                       QObject* parent)
    : EventTransport(parent)
    , m_connection(connection)
    , m_windowLabel(windowLabel)
{
    if (!m_connection.isConnected()) {
        qCWarning(lcTransport) << "Cannot connect to session D-Bus - windows will not sync";
        return;
    }

    // Empty service: match the signal from every window, this one included
    m_subscribed = m_connection.connect(QString(), DBus::ObjectPath, DBus::Interface::Sync, DBus::Signal::Event, this,
                                        SLOT(onEvent(QString, QString)));
    if (!m_subscribed) {
        qCWarning(lcTransport) << "Failed to subscribe to" << DBus::Interface::Sync << "signals:"
                               << m_connection.lastError().message();
        return;
    }

    qCInfo(lcTransport) << "D-Bus event bus ready on" << m_connection.baseService() << "as" << m_windowLabel;
}

DBusEventTransport::~DBusEventTransport()
{
    if (m_subscribed) {
        m_connection.disconnect(QString(), DBus::ObjectPath, DBus::Interface::Sync, DBus::Signal::Event, this,
                                SLOT(onEvent(QString, QString)));
    }
}

bool DBusEventTransport::publish(const QString& channel, const QJsonObject& payload)
{
    if (!m_subscribed) {
        return false;
    }

    QDBusMessage message = QDBusMessage::createSignal(DBus::ObjectPath, DBus::Interface::Sync, DBus::Signal::Event);
    message << channel << QString::fromUtf8(QJsonDocument(payload).toJson(QJsonDocument::Compact));

    if (!m_connection.send(message)) {
        qCWarning(lcTransport) << "Failed to send" << channel << "event:" << m_connection.lastError().message();
        return false;
    }
    return true;
}

void DBusEventTransport::onEvent(const QString& channel, const QString& payload)
{
    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(payload.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        qCWarning(lcTransport) << "Dropping malformed payload on channel" << channel << ":" << error.errorString();
        return;
    }

    dispatch(channel, document.object());
}

} // namespace PaneSync

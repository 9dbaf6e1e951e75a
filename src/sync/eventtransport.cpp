// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "eventtransport.h"
#include <QPointer>

namespace PaneSync {

EventTransport::EventTransport(QObject* parent)
    : QObject(parent)
{
}

EventTransport::~EventTransport() = default;

Teardown EventTransport::listen(const QString& channel, Handler handler)
{
    if (!handler) {
        return Teardown();
    }

    const quint64 id = m_nextListenerId++;
    m_listeners[channel].append(Listener{id, std::move(handler)});
    qCDebug(lcTransport) << "Listening on" << channel << "- listeners:" << m_listeners.value(channel).size();

    QPointer<EventTransport> guard(this);
    return [guard, channel, id]() {
        if (guard) {
            guard->removeListener(channel, id);
        }
    };
}

int EventTransport::listenerCount(const QString& channel) const
{
    return m_listeners.value(channel).size();
}

void EventTransport::removeListener(const QString& channel, quint64 id)
{
    auto it = m_listeners.find(channel);
    if (it == m_listeners.end()) {
        return;
    }
    it->removeIf([id](const Listener& listener) {
        return listener.id == id;
    });
    if (it->isEmpty()) {
        m_listeners.erase(it);
    }
}

void EventTransport::dispatch(const QString& channel, const QJsonObject& payload)
{
    // Copy: a handler may tear itself (or others) down
    const QVector<Listener> listeners = m_listeners.value(channel);
    for (const Listener& listener : listeners) {
        listener.handler(payload);
    }
}

} // namespace PaneSync

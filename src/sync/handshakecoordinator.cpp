// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "handshakecoordinator.h"
#include "broadcasttrigger.h"
#include "../core/constants.h"
#include "../core/logging.h"

namespace PaneSync {

HandshakeCoordinator::HandshakeCoordinator(EventTransport* transport, BroadcastTrigger* trigger, QObject* parent)
    : QObject(parent)
    , m_transport(transport)
    , m_trigger(trigger)
{
    m_graceTimer.setSingleShot(true);
    m_graceTimer.setInterval(Defaults::HandshakeGraceMs);
    connect(&m_graceTimer, &QTimer::timeout, this, &HandshakeCoordinator::onGraceElapsed);
}

HandshakeCoordinator::~HandshakeCoordinator()
{
    stop();
}

void HandshakeCoordinator::setGraceMs(int ms)
{
    m_graceTimer.setInterval(qMax(0, ms));
}

Teardown HandshakeCoordinator::start()
{
    if (m_state != State::Booting) {
        qCWarning(lcHandshake) << "start() called twice, ignoring";
        return Teardown();
    }
    if (!m_transport) {
        qCWarning(lcHandshake) << "No transport, handshake skipped";
        return Teardown();
    }

    // Peers answer the announcement with snapshots, so sync-state must be heard first
    if (m_transport->listenerCount(Channel::SyncState) == 0) {
        qCWarning(lcHandshake) << "Announcing before anything listens on" << Channel::SyncState
                               << "- the initial state reply will be lost";
    }

    m_unlisten = m_transport->listen<ReadyMessage>(Channel::WindowReady, [this](const ReadyMessage& message) {
        onReadyMessage(message);
    });

    const ReadyMessage ready{m_transport->windowLabel()};
    if (!m_transport->publish(Channel::WindowReady, ready)) {
        qCWarning(lcHandshake) << "Failed to announce window" << ready.origin;
    } else {
        qCInfo(lcHandshake) << "Window" << ready.origin << "announced";
    }
    setState(State::Announced);

    QPointer<HandshakeCoordinator> guard(this);
    return [guard]() {
        if (guard) {
            guard->stop();
        }
    };
}

void HandshakeCoordinator::stop()
{
    m_graceTimer.stop();
    if (m_unlisten) {
        m_unlisten();
        m_unlisten = nullptr;
    }
    // A later start() announces again
    setState(State::Booting);
}

void HandshakeCoordinator::notePeerTraffic(const QString& origin)
{
    if (m_state == State::Announced && m_transport && origin != m_transport->windowLabel()) {
        setState(State::Steady);
    }
}

void HandshakeCoordinator::onReadyMessage(const ReadyMessage& message)
{
    if (!m_transport || message.origin == m_transport->windowLabel()) {
        return;
    }
    if (m_state == State::Booting) {
        qCDebug(lcHandshake) << "Ignoring announcement from" << message.origin << "before our own";
        return;
    }

    qCInfo(lcHandshake) << "Window" << message.origin << "joined, replying in" << m_graceTimer.interval() << "ms";
    Q_EMIT peerAnnounced(message.origin);
    notePeerTraffic(message.origin);

    if (!m_graceTimer.isActive()) {
        m_graceTimer.start();
    }
}

void HandshakeCoordinator::onGraceElapsed()
{
    if (!m_trigger) {
        return;
    }
    qCDebug(lcHandshake) << "Sending full state to new windows";
    m_trigger->broadcastAll();
    Q_EMIT fullStateBroadcast();
}

void HandshakeCoordinator::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    qCDebug(lcHandshake) << "Handshake state:" << state;
    Q_EMIT stateChanged(state);
}

} // namespace PaneSync

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "syncsession.h"
#include "broadcasttrigger.h"
#include "handshakecoordinator.h"
#include "syncreceiver.h"
#include "../core/logging.h"

namespace PaneSync {

SyncSession::SyncSession(EventTransport* transport, FileStore* fileStore, LayoutStore* layoutStore, QObject* parent)
    : QObject(parent)
    , m_transport(transport)
    , m_trigger(new BroadcastTrigger(transport, fileStore, layoutStore, this))
    , m_receiver(new SyncReceiver(transport, fileStore, layoutStore, m_trigger, this))
    , m_handshake(new HandshakeCoordinator(transport, m_trigger, this))
{
    connect(m_receiver, &SyncReceiver::peerTraffic, m_handshake, &HandshakeCoordinator::notePeerTraffic);
}

SyncSession::~SyncSession()
{
    shutdown();
}

void SyncSession::setHandshakeGraceMs(int ms)
{
    m_handshake->setGraceMs(ms);
}

Teardown SyncSession::initialize()
{
    if (!m_transport || !m_transport->isAvailable()) {
        qCWarning(lcSync) << "Event bus unavailable, cross-window sync disabled";
        return Teardown();
    }

    QPointer<SyncSession> guard(this);
    Teardown teardown = [guard]() {
        if (guard) {
            guard->shutdown();
        }
    };

    if (m_active) {
        qCDebug(lcSync) << "Sync session already initialized";
        return teardown;
    }

    m_receiverTeardown = m_receiver->start();
    m_trigger->attach();
    m_handshakeTeardown = m_handshake->start();
    m_active = true;

    qCInfo(lcSync) << "Sync session started for window" << m_transport->windowLabel();
    return teardown;
}

void SyncSession::shutdown()
{
    if (!m_active) {
        return;
    }
    if (m_handshakeTeardown) {
        m_handshakeTeardown();
        m_handshakeTeardown = nullptr;
    }
    m_trigger->detach();
    if (m_receiverTeardown) {
        m_receiverTeardown();
        m_receiverTeardown = nullptr;
    }
    m_active = false;
    qCInfo(lcSync) << "Sync session stopped";
}

} // namespace PaneSync

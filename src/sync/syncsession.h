// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include "eventtransport.h"
#include <QObject>
#include <QPointer>

namespace PaneSync {

class BroadcastTrigger;
class FileStore;
class HandshakeCoordinator;
class LayoutStore;
class SyncReceiver;

/**
 * @brief Cross-window sync for one window
 *
 * Owns the receiver, broadcast trigger and handshake coordinator, and
 * wires them in this order:
 * 1. receiver subscribes to "sync-state"
 * 2. trigger starts watching the stores
 * 3. handshake subscribes to "window-ready" and announces the window
 *
 * The Teardown returned by initialize() undoes all of it. Destroying the
 * session does the same.
 */
class PANESYNC_EXPORT SyncSession : public QObject
{
    Q_OBJECT

public:
    SyncSession(EventTransport* transport, FileStore* fileStore, LayoutStore* layoutStore, QObject* parent = nullptr);
    ~SyncSession() override;

    void setHandshakeGraceMs(int ms);

    /**
     * @brief Start syncing
     * @return Aggregate teardown; empty if the transport is unavailable
     */
    Teardown initialize();

    bool isActive() const
    {
        return m_active;
    }

    BroadcastTrigger* trigger() const
    {
        return m_trigger;
    }
    SyncReceiver* receiver() const
    {
        return m_receiver;
    }
    HandshakeCoordinator* handshake() const
    {
        return m_handshake;
    }

private:
    void shutdown();

    QPointer<EventTransport> m_transport;
    BroadcastTrigger* m_trigger;
    SyncReceiver* m_receiver;
    HandshakeCoordinator* m_handshake;

    Teardown m_receiverTeardown;
    Teardown m_handshakeTeardown;
    bool m_active = false;
};

} // namespace PaneSync

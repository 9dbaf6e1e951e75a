// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include "eventtransport.h"
#include "syncmessage.h"
#include <QObject>
#include <QPointer>
#include <QTimer>

namespace PaneSync {

class BroadcastTrigger;

/**
 * @brief Announces this window and answers other windows' announcements
 *
 * State machine:
 * - Booting: nothing sent yet. start() subscribes to "window-ready" and
 *   then publishes this window's ReadyMessage, moving to Announced.
 * - Announced: a ReadyMessage from another window schedules a full-state
 *   broadcast after the grace delay. Any traffic from a peer moves to Steady.
 * - Steady: same handling as Announced.
 *
 * Self-originated ReadyMessages are ignored. Several announcements arriving
 * within one grace delay are answered with a single broadcast. stop() returns
 * to Booting.
 */
class PANESYNC_EXPORT HandshakeCoordinator : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Booting,
        Announced,
        Steady
    };
    Q_ENUM(State)

    HandshakeCoordinator(EventTransport* transport, BroadcastTrigger* trigger, QObject* parent = nullptr);
    ~HandshakeCoordinator() override;

    State state() const
    {
        return m_state;
    }

    int graceMs() const
    {
        return m_graceTimer.interval();
    }
    void setGraceMs(int ms);

    bool isReplyPending() const
    {
        return m_graceTimer.isActive();
    }

    /**
     * @brief Subscribe to readiness announcements and announce this window
     * @return Teardown that unsubscribes and cancels a pending reply
     */
    Teardown start();

    /**
     * @brief Record that a message from another window arrived
     */
    void notePeerTraffic(const QString& origin);

Q_SIGNALS:
    void stateChanged(PaneSync::HandshakeCoordinator::State state);
    void peerAnnounced(const QString& origin);
    void fullStateBroadcast();

private:
    void onReadyMessage(const ReadyMessage& message);
    void onGraceElapsed();
    void setState(State state);
    void stop();

    QPointer<EventTransport> m_transport;
    QPointer<BroadcastTrigger> m_trigger;
    QTimer m_graceTimer;
    Teardown m_unlisten;
    State m_state = State::Booting;
};

} // namespace PaneSync

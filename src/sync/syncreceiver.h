// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include "eventtransport.h"
#include "syncmessage.h"
#include <QObject>
#include <QPointer>

namespace PaneSync {

class BroadcastTrigger;
class FileStore;
class LayoutStore;

/**
 * @brief Applies snapshots received from other windows to the local stores
 *
 * Messages carrying this window's own label are ignored. Applying the same
 * message twice leaves the stores as applying it once.
 *
 * After a file snapshot is merged, tabs that have a path but no content are
 * queued for reload from disk, and a changed project root triggers a file
 * tree refresh. After any merge, pane file references are validated
 * against the open tabs.
 */
class PANESYNC_EXPORT SyncReceiver : public QObject
{
    Q_OBJECT

public:
    SyncReceiver(EventTransport* transport, FileStore* fileStore, LayoutStore* layoutStore, BroadcastTrigger* trigger,
                 QObject* parent = nullptr);
    ~SyncReceiver() override;

    /**
     * @brief Subscribe to the "sync-state" channel
     * @return Teardown that unsubscribes
     */
    Teardown start();

    /**
     * @brief Apply one message; called for every message on the channel
     */
    void apply(const SyncMessage& message);

Q_SIGNALS:
    void peerTraffic(const QString& origin);
    void remoteStateApplied(const QString& store, const QString& origin);

private:
    void applyFileState(const SyncMessage& message);
    void applyLayoutState(const SyncMessage& message);
    void validateLayout();

    QPointer<EventTransport> m_transport;
    QPointer<FileStore> m_fileStore;
    QPointer<LayoutStore> m_layoutStore;
    QPointer<BroadcastTrigger> m_trigger;
    Teardown m_unlisten;
};

} // namespace PaneSync

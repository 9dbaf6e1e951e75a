// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include "../core/types.h"
#include <QMetaObject>
#include <QObject>
#include <QPointer>

namespace PaneSync {

class EventTransport;
class FileStore;
class LayoutStore;

/**
 * @brief Publishes store snapshots when replicated fields change
 *
 * Watches each store's stateChanged(previous, next) stream and broadcasts
 * on the "sync-state" channel only when an allowlisted field differs:
 * - file store: activeFileId, rootPath, number of open files
 * - layout store: activePaneId, isChatOpen, isTerminalOpen, number of panes
 *
 * Publishing is fire-and-forget. A failed publish is logged and reported
 * through broadcastFailed(); it never propagates into the store.
 *
 * While suspended (see RemoteApplyScope) changes are not broadcast. The
 * full-state broadcast used by the handshake ignores both the allowlist
 * and suspension.
 */
class PANESYNC_EXPORT BroadcastTrigger : public QObject
{
    Q_OBJECT

public:
    BroadcastTrigger(EventTransport* transport, FileStore* fileStore, LayoutStore* layoutStore,
                     QObject* parent = nullptr);
    ~BroadcastTrigger() override;

    /**
     * @brief Start watching the stores
     */
    void attach();

    /**
     * @brief Stop watching the stores
     */
    void detach();

    bool isAttached() const
    {
        return m_attached;
    }

    static bool fileChangeWarrantsBroadcast(const FileState& previous, const FileState& next);
    static bool layoutChangeWarrantsBroadcast(const LayoutState& previous, const LayoutState& next);

    /**
     * @brief Publish the current state of every store, unconditionally
     */
    void broadcastAll();

    void suspend();
    void resume();
    bool isSuspended() const
    {
        return m_suspendDepth > 0;
    }

Q_SIGNALS:
    void broadcastSent(const QString& store);
    void broadcastFailed(const QString& store);

private Q_SLOTS:
    void onFileStateChanged(const PaneSync::FileState& previous, const PaneSync::FileState& next);
    void onLayoutStateChanged(const PaneSync::LayoutState& previous, const PaneSync::LayoutState& next);

private:
    void broadcastFileState(const FileState& state);
    void broadcastLayoutState(const LayoutState& state);
    void publish(const QString& store, const QJsonObject& payload);

    QPointer<EventTransport> m_transport;
    QPointer<FileStore> m_fileStore;
    QPointer<LayoutStore> m_layoutStore;

    QMetaObject::Connection m_fileConnection;
    QMetaObject::Connection m_layoutConnection;
    bool m_attached = false;
    int m_suspendDepth = 0;
};

} // namespace PaneSync

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "broadcasttrigger.h"
#include "eventtransport.h"
#include "snapshotbuilder.h"
#include "../core/constants.h"
#include "../core/filestore.h"
#include "../core/layoutstore.h"
#include "../core/logging.h"

namespace PaneSync {

BroadcastTrigger::BroadcastTrigger(EventTransport* transport, FileStore* fileStore, LayoutStore* layoutStore,
                                   QObject* parent)
    : QObject(parent)
    , m_transport(transport)
    , m_fileStore(fileStore)
    , m_layoutStore(layoutStore)
{
}

BroadcastTrigger::~BroadcastTrigger()
{
    detach();
}

void BroadcastTrigger::attach()
{
    if (m_attached) {
        return;
    }
    if (m_fileStore) {
        m_fileConnection =
            connect(m_fileStore, &FileStore::stateChanged, this, &BroadcastTrigger::onFileStateChanged);
    }
    if (m_layoutStore) {
        m_layoutConnection =
            connect(m_layoutStore, &LayoutStore::stateChanged, this, &BroadcastTrigger::onLayoutStateChanged);
    }
    m_attached = true;
}

void BroadcastTrigger::detach()
{
    if (!m_attached) {
        return;
    }
    disconnect(m_fileConnection);
    disconnect(m_layoutConnection);
    m_attached = false;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Allowlist
// ═══════════════════════════════════════════════════════════════════════════════

bool BroadcastTrigger::fileChangeWarrantsBroadcast(const FileState& previous, const FileState& next)
{
    return previous.activeFileId != next.activeFileId || previous.rootPath != next.rootPath
        || previous.openedFiles.size() != next.openedFiles.size();
}

bool BroadcastTrigger::layoutChangeWarrantsBroadcast(const LayoutState& previous, const LayoutState& next)
{
    return previous.activePaneId != next.activePaneId || previous.isChatOpen != next.isChatOpen
        || previous.isTerminalOpen != next.isTerminalOpen || previous.panes.size() != next.panes.size();
}

void BroadcastTrigger::onFileStateChanged(const FileState& previous, const FileState& next)
{
    if (isSuspended() || !fileChangeWarrantsBroadcast(previous, next)) {
        return;
    }
    broadcastFileState(next);
}

void BroadcastTrigger::onLayoutStateChanged(const LayoutState& previous, const LayoutState& next)
{
    if (isSuspended() || !layoutChangeWarrantsBroadcast(previous, next)) {
        return;
    }
    broadcastLayoutState(next);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Publishing
// ═══════════════════════════════════════════════════════════════════════════════

void BroadcastTrigger::broadcastAll()
{
    if (m_fileStore) {
        broadcastFileState(m_fileStore->state());
    }
    if (m_layoutStore) {
        broadcastLayoutState(m_layoutStore->state());
    }
}

void BroadcastTrigger::broadcastFileState(const FileState& state)
{
    if (!m_transport) {
        return;
    }
    publish(StoreName::File, SnapshotBuilder::buildFileMessage(m_transport->windowLabel(), state).toJson());
}

void BroadcastTrigger::broadcastLayoutState(const LayoutState& state)
{
    if (!m_transport) {
        return;
    }
    publish(StoreName::Layout, SnapshotBuilder::buildLayoutMessage(m_transport->windowLabel(), state).toJson());
}

void BroadcastTrigger::publish(const QString& store, const QJsonObject& payload)
{
    if (!m_transport->publish(Channel::SyncState, payload)) {
        qCWarning(lcSync) << "Failed to broadcast" << store << "state";
        Q_EMIT broadcastFailed(store);
        return;
    }
    qCDebug(lcSync) << "Broadcast" << store << "state";
    Q_EMIT broadcastSent(store);
}

void BroadcastTrigger::suspend()
{
    ++m_suspendDepth;
}

void BroadcastTrigger::resume()
{
    if (m_suspendDepth == 0) {
        qCWarning(lcSync) << "resume() without matching suspend()";
        return;
    }
    --m_suspendDepth;
}

} // namespace PaneSync

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "syncreceiver.h"
#include "broadcasttrigger.h"
#include "remoteapplyscope.h"
#include "../core/constants.h"
#include "../core/filestore.h"
#include "../core/layoutstore.h"
#include "../core/logging.h"

namespace PaneSync {

SyncReceiver::SyncReceiver(EventTransport* transport, FileStore* fileStore, LayoutStore* layoutStore,
                           BroadcastTrigger* trigger, QObject* parent)
    : QObject(parent)
    , m_transport(transport)
    , m_fileStore(fileStore)
    , m_layoutStore(layoutStore)
    , m_trigger(trigger)
{
}

SyncReceiver::~SyncReceiver()
{
    if (m_unlisten) {
        m_unlisten();
    }
}

Teardown SyncReceiver::start()
{
    if (!m_transport) {
        return Teardown();
    }
    if (m_unlisten) {
        m_unlisten();
    }
    m_unlisten = m_transport->listen<SyncMessage>(Channel::SyncState, [this](const SyncMessage& message) {
        apply(message);
    });

    QPointer<SyncReceiver> guard(this);
    return [guard]() {
        if (guard && guard->m_unlisten) {
            guard->m_unlisten();
            guard->m_unlisten = nullptr;
        }
    };
}

void SyncReceiver::apply(const SyncMessage& message)
{
    if (!m_transport || message.origin == m_transport->windowLabel()) {
        return;
    }

    Q_EMIT peerTraffic(message.origin);

    if (message.store == StoreName::File) {
        applyFileState(message);
    } else if (message.store == StoreName::Layout) {
        applyLayoutState(message);
    } else {
        qCWarning(lcSync) << "Ignoring snapshot for unknown store" << message.store << "from" << message.origin;
        return;
    }

    Q_EMIT remoteStateApplied(message.store, message.origin);
}

void SyncReceiver::applyFileState(const SyncMessage& message)
{
    if (!m_fileStore) {
        return;
    }

    const FileSnapshot snapshot = FileSnapshot::fromJson(message.state);
    const QString previousRoot = m_fileStore->rootPath();
    qCDebug(lcSync) << "Applying file state from" << message.origin;

    {
        RemoteApplyScope scope(m_trigger);
        m_fileStore->syncState(snapshot);
        validateLayout();
    }

    // Snapshots never carry content: fetch it for every tab that needs it
    if (snapshot.openedFiles) {
        for (const OpenedFile& incoming : *snapshot.openedFiles) {
            const OpenedFile* local = m_fileStore->state().fileById(incoming.id);
            if (local && local->content.isEmpty() && !local->path.isEmpty()) {
                m_fileStore->reloadFileContent(incoming.id);
            }
        }
    }

    if (snapshot.rootPath && !snapshot.rootPath->isEmpty() && *snapshot.rootPath != previousRoot) {
        qCInfo(lcSync) << "Project root changed by" << message.origin << "to" << *snapshot.rootPath;
        m_fileStore->refreshFileTree();
    }
}

void SyncReceiver::applyLayoutState(const SyncMessage& message)
{
    if (!m_layoutStore) {
        return;
    }

    qCDebug(lcSync) << "Applying layout state from" << message.origin;
    RemoteApplyScope scope(m_trigger);
    m_layoutStore->syncState(LayoutSnapshot::fromJson(message.state));
    validateLayout();
}

void SyncReceiver::validateLayout()
{
    if (m_fileStore && m_layoutStore) {
        m_layoutStore->validateLayout(m_fileStore->state().openedFileIds());
    }
}

} // namespace PaneSync

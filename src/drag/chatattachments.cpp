// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "chatattachments.h"
#include "dragregionarbiter.h"
#include "dragstate.h"
#include "../core/logging.h"

namespace PaneSync {

ChatAttachments::ChatAttachments(DragOverChatFlag* flag, DragRegionArbiter* arbiter, QObject* parent)
    : QObject(parent)
    , m_flag(flag)
    , m_arbiter(arbiter)
{
}

void ChatAttachments::onFilesDropped(const QStringList& paths)
{
    const bool overChat = m_arbiter ? m_arbiter->resolveForDrop() : (m_flag && m_flag->value());
    if (!overChat) {
        return;
    }

    bool added = false;
    for (const QString& path : paths) {
        if (!m_paths.contains(path)) {
            m_paths.append(path);
            added = true;
        }
    }
    if (added) {
        qCDebug(lcDrop) << "Chat attachments:" << m_paths.size();
        Q_EMIT pathsChanged();
    }
}

void ChatAttachments::removeAttachment(const QString& path)
{
    if (m_paths.removeAll(path) > 0) {
        Q_EMIT pathsChanged();
    }
}

void ChatAttachments::clear()
{
    if (!m_paths.isEmpty()) {
        m_paths.clear();
        Q_EMIT pathsChanged();
    }
}

} // namespace PaneSync

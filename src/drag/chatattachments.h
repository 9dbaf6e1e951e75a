// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include <QObject>
#include <QPointer>
#include <QStringList>

namespace PaneSync {

class DragOverChatFlag;
class DragRegionArbiter;

/**
 * @brief Collects files dropped on the chat panel as pending attachments
 *
 * Listens to the same native drop event as the FileDropRouter and takes
 * only drops for which the drag-over-chat flag is true.
 */
class PANESYNC_EXPORT ChatAttachments : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QStringList paths READ paths NOTIFY pathsChanged)

public:
    ChatAttachments(DragOverChatFlag* flag, DragRegionArbiter* arbiter, QObject* parent = nullptr);

    QStringList paths() const { return m_paths; }

    Q_INVOKABLE void removeAttachment(const QString& path);
    Q_INVOKABLE void clear();

public Q_SLOTS:
    void onFilesDropped(const QStringList& paths);

Q_SIGNALS:
    void pathsChanged();

private:
    QPointer<DragOverChatFlag> m_flag;
    QPointer<DragRegionArbiter> m_arbiter;
    QStringList m_paths;
};

} // namespace PaneSync

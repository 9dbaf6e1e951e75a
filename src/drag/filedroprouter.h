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
class FileActions;
class INotifier;

/**
 * @brief Opens dropped files in the editor unless they were dropped on the chat
 *
 * When the drag-over-chat flag is true the drop belongs to the chat
 * attachment consumer and the router does nothing. Otherwise each path is
 * opened in order; a path that fails is logged and shown as a toast, and
 * the remaining paths are still opened.
 */
class PANESYNC_EXPORT FileDropRouter : public QObject
{
    Q_OBJECT

public:
    /**
     * @param flag Drag-over-chat flag written by the arbiter
     * @param arbiter Used to re-derive the flag when nothing set it this drag (can be null)
     * @param fileActions Opens each path
     * @param notifier Toast surface for failures (can be null)
     */
    FileDropRouter(DragOverChatFlag* flag, DragRegionArbiter* arbiter, FileActions* fileActions,
                   INotifier* notifier, QObject* parent = nullptr);

public Q_SLOTS:
    void onFilesDropped(const QStringList& paths);

Q_SIGNALS:
    void dropIgnoredForChat(const QStringList& paths);
    void filesOpened(const QStringList& fileIds);
    void fileOpenFailed(const QString& path, const QString& reason);

private:
    bool isDropOverChat() const;

    QPointer<DragOverChatFlag> m_flag;
    QPointer<DragRegionArbiter> m_arbiter;
    FileActions* m_fileActions;
    QPointer<INotifier> m_notifier;
};

} // namespace PaneSync

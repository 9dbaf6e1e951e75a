// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "filedroprouter.h"
#include "dragregionarbiter.h"
#include "dragstate.h"
#include "../core/fileactions.h"
#include "../core/interfaces.h"
#include "../core/logging.h"
#include <KLocalizedString>

namespace PaneSync {

FileDropRouter::FileDropRouter(DragOverChatFlag* flag, DragRegionArbiter* arbiter, FileActions* fileActions,
                               INotifier* notifier, QObject* parent)
    : QObject(parent)
    , m_flag(flag)
    , m_arbiter(arbiter)
    , m_fileActions(fileActions)
    , m_notifier(notifier)
{
}

bool FileDropRouter::isDropOverChat() const
{
    if (m_arbiter) {
        return m_arbiter->resolveForDrop();
    }
    return m_flag && m_flag->value();
}

void FileDropRouter::onFilesDropped(const QStringList& paths)
{
    if (paths.isEmpty()) {
        return;
    }

    if (isDropOverChat()) {
        qCDebug(lcDrop) << "Drop landed on the chat panel, leaving" << paths.size() << "files to chat attachments";
        Q_EMIT dropIgnoredForChat(paths);
        return;
    }

    if (!m_fileActions) {
        qCWarning(lcDrop) << "No file actions, cannot open dropped files";
        return;
    }

    QStringList opened;
    for (const QString& path : paths) {
        const FileOpenResult result = m_fileActions->openFileFromPath(path);
        if (!result.success) {
            qCWarning(lcDrop) << "Failed to open dropped file" << path << ":" << result.errorMessage;
            if (m_notifier) {
                m_notifier->showError(i18n("Cannot open file"), result.errorMessage);
            }
            Q_EMIT fileOpenFailed(path, result.errorMessage);
            continue;
        }
        opened.append(result.fileId);
    }

    if (!opened.isEmpty()) {
        Q_EMIT filesOpened(opened);
    }
}

} // namespace PaneSync

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "snapshotbuilder.h"
#include "../core/constants.h"

namespace PaneSync {
namespace SnapshotBuilder {

FileSnapshot buildFileSnapshot(const FileState& state)
{
    QVector<OpenedFile> files;
    files.reserve(state.openedFiles.size());
    for (const OpenedFile& file : state.openedFiles) {
        OpenedFile entry;
        entry.id = file.id;
        entry.path = file.path;
        entry.name = file.name;
        entry.isDirty = file.isDirty;
        entry.language = file.language;
        entry.content = QStringLiteral("");
        files.append(entry);
    }

    FileSnapshot snapshot;
    snapshot.openedFiles = files;
    snapshot.activeFileId = state.activeFileId;
    snapshot.rootPath = state.rootPath;
    return snapshot;
}

LayoutSnapshot buildLayoutSnapshot(const LayoutState& state)
{
    LayoutSnapshot snapshot;
    snapshot.panes = state.panes;
    snapshot.activePaneId = state.activePaneId;
    snapshot.isChatOpen = state.isChatOpen;
    snapshot.isTerminalOpen = state.isTerminalOpen;
    return snapshot;
}

SyncMessage buildFileMessage(const QString& origin, const FileState& state)
{
    return SyncMessage{origin, StoreName::File, buildFileSnapshot(state).toJson()};
}

SyncMessage buildLayoutMessage(const QString& origin, const LayoutState& state)
{
    return SyncMessage{origin, StoreName::Layout, buildLayoutSnapshot(state).toJson()};
}

} // namespace SnapshotBuilder
} // namespace PaneSync

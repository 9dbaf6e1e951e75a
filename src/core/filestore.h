// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include "types.h"
#include <QObject>
#include <QString>

namespace PaneSync {

class IFileSystem;

/**
 * @brief Owns the open files, the active file and the project root of one window
 *
 * Every mutation publishes stateChanged(previous, next) with full copies of
 * the state before and after, which is what the broadcast trigger diffs.
 * Mutations that leave the state unchanged emit nothing.
 *
 * Disk access (content reload, file tree refresh) is queued onto the event
 * loop and reported through signals; failures are logged and never thrown.
 */
class PANESYNC_EXPORT FileStore : public QObject
{
    Q_OBJECT

    Q_PROPERTY(QString activeFileId READ activeFileId NOTIFY activeFileIdChanged)
    Q_PROPERTY(QString rootPath READ rootPath NOTIFY rootPathChanged)
    Q_PROPERTY(int openedFileCount READ openedFileCount NOTIFY openedFilesChanged)

public:
    explicit FileStore(IFileSystem* fileSystem, QObject* parent = nullptr);
    ~FileStore() override = default;

    FileStore(const FileStore&) = delete;
    FileStore& operator=(const FileStore&) = delete;

    const FileState& state() const
    {
        return m_state;
    }
    QString activeFileId() const
    {
        return m_state.activeFileId;
    }
    QString rootPath() const
    {
        return m_state.rootPath;
    }
    int openedFileCount() const
    {
        return m_state.openedFiles.size();
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Tabs
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Open a file in a new tab, or re-activate the tab showing its path
     * @param file File record; a null content means "keep the existing content"
     * @return Id of the activated tab
     *
     * When the path is already open the existing tab keeps its id. Its content
     * is replaced only if at most one side is dirty.
     */
    QString openFile(const OpenedFile& file);

    /**
     * @brief Close a tab; the last remaining tab becomes active if it was active
     */
    void closeFile(const QString& id);

    void setActiveFile(const QString& id);
    void updateFileContent(const QString& id, const QString& content);
    void setFileDirty(const QString& id, bool isDirty);

    // ═══════════════════════════════════════════════════════════════════════
    // Project
    // ═══════════════════════════════════════════════════════════════════════

    void setRootPath(const QString& path);

    /**
     * @brief Queue a reload of a tab's content from disk
     *
     * Skipped for dirty tabs and tabs without a path. On failure the tab
     * stays as it is and fileContentReloadFailed() is emitted.
     */
    void reloadFileContent(const QString& id);

    /**
     * @brief Queue a rebuild of the file tree from the current root path
     */
    void refreshFileTree();

    // ═══════════════════════════════════════════════════════════════════════
    // Replication
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Merge a snapshot received from another window
     *
     * Only fields present in the snapshot are overwritten. Incoming tabs that
     * match a local tab by id and path keep the local content, since
     * snapshots never carry content.
     */
    void syncState(const FileSnapshot& snapshot);

Q_SIGNALS:
    void stateChanged(const PaneSync::FileState& previous, const PaneSync::FileState& next);
    void activeFileIdChanged();
    void rootPathChanged();
    void openedFilesChanged();

    void fileContentReloaded(const QString& id);
    void fileContentReloadFailed(const QString& id, const QString& path);
    void fileTreeRefreshed();
    void fileTreeRefreshFailed(const QString& rootPath);

private:
    void doReloadFileContent(const QString& id);
    void doRefreshFileTree();

    // Emits stateChanged and the per-property signals if m_state differs from previous
    void commit(const FileState& previous);

    OpenedFile* mutableFileById(const QString& id);

    IFileSystem* m_fileSystem;
    FileState m_state;
};

} // namespace PaneSync

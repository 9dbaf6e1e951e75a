// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include <QString>
#include <optional>

namespace PaneSync {

class FileStore;
class IFileSystem;
class LayoutStore;

/**
 * @brief Result of opening a file from disk
 */
struct PANESYNC_EXPORT FileOpenResult {
    bool success = false;
    QString fileId;
    QString errorMessage; ///< Human-readable reason when success is false
};

/**
 * @brief User-level file commands that touch both stores
 *
 * Opening a file reads it through IFileSystem, detects its language, adds
 * it to the FileStore and shows it in the active pane of the LayoutStore.
 * Reload and tree refresh forward to the FileStore's queued operations.
 *
 * Does not own any of its collaborators.
 */
class PANESYNC_EXPORT FileActions
{
public:
    FileActions(FileStore* fileStore, LayoutStore* layoutStore, IFileSystem* fileSystem);

    /**
     * @brief Open a file in a tab and assign it to the active pane
     * @param path Absolute path on disk
     * @param initialLine Optional line to reveal
     * @return FileOpenResult with the tab id, or the failure reason
     */
    FileOpenResult openFileFromPath(const QString& path, std::optional<int> initialLine = std::nullopt);

    void refreshFileTree();

private:
    FileStore* m_fileStore;
    LayoutStore* m_layoutStore;
    IFileSystem* m_fileSystem;
};

} // namespace PaneSync

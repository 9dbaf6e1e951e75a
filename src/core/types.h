// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include <QJsonObject>
#include <QMetaType>
#include <QPointF>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

namespace PaneSync {

// ═══════════════════════════════════════════════════════════════════════════════
// Shared value types for the file and layout stores
// ═══════════════════════════════════════════════════════════════════════════════
// Stores hold these by value and publish (previous, next) copies on every
// mutation, so they must stay cheap to copy (implicitly shared Qt containers).
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief A file opened in an editor tab
 */
struct PANESYNC_EXPORT OpenedFile
{
    QString id;
    QString path; ///< Absolute path on disk (empty for unsaved buffers)
    QString name; ///< Display name (file name part of path)
    QString content;
    bool isDirty = false;
    QString language; ///< Editor language id, see detectLanguageFromPath()
    std::optional<int> initialLine; ///< Line to reveal when the tab is shown

    bool operator==(const OpenedFile& other) const;
    bool operator!=(const OpenedFile& other) const
    {
        return !(*this == other);
    }
};

/**
 * @brief Node of the project file tree
 */
struct PANESYNC_EXPORT FileNode
{
    QString id;
    QString name;
    QString path;
    bool isDirectory = false;
    QVector<FileNode> children;

    bool operator==(const FileNode& other) const;
    bool operator!=(const FileNode& other) const
    {
        return !(*this == other);
    }
};

/**
 * @brief Full local state of the file store
 */
struct PANESYNC_EXPORT FileState
{
    std::optional<FileNode> fileTree;
    QString rootPath; ///< Empty when no project is open
    QVector<OpenedFile> openedFiles;
    QString activeFileId; ///< Empty when no file is active

    const OpenedFile* fileById(const QString& id) const;
    const OpenedFile* fileByPath(const QString& path) const;
    QStringList openedFileIds() const;

    bool operator==(const FileState& other) const;
    bool operator!=(const FileState& other) const
    {
        return !(*this == other);
    }
};

enum class SplitDirection {
    Horizontal = 0,
    Vertical = 1
};

/**
 * @brief One region of the split editor area
 *
 * Sizes are percentages; all panes of a layout sum to 100.
 */
struct PANESYNC_EXPORT Pane
{
    QString id;
    QString fileId; ///< Empty when the pane shows no file
    qreal size = 100.0;
    QPointF position;

    bool operator==(const Pane& other) const;
    bool operator!=(const Pane& other) const
    {
        return !(*this == other);
    }
};

/**
 * @brief Full local state of the layout store
 */
struct PANESYNC_EXPORT LayoutState
{
    // Panel visibility
    bool isChatOpen = true;
    bool isTerminalOpen = false;
    bool isCommandPaletteOpen = false;
    bool isSettingsOpen = false;
    bool isSidebarOpen = true;
    int chatWidth = 384;
    int sidebarWidth = 250;

    // Split layout
    QVector<Pane> panes;
    QString activePaneId;
    SplitDirection splitDirection = SplitDirection::Horizontal;

    const Pane* paneById(const QString& id) const;
    int paneIndex(const QString& id) const;
    qreal totalPaneSize() const;

    bool operator==(const LayoutState& other) const;
    bool operator!=(const LayoutState& other) const
    {
        return !(*this == other);
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Snapshots - the wire-safe subsets of each store
// ═══════════════════════════════════════════════════════════════════════════════
// Every field is optional so a received snapshot merges only what it carries.
// Snapshots built locally always have every field set.
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Replicated subset of FileState (content is always empty)
 */
struct PANESYNC_EXPORT FileSnapshot
{
    std::optional<QVector<OpenedFile>> openedFiles;
    std::optional<QString> activeFileId;
    std::optional<QString> rootPath;

    bool isEmpty() const
    {
        return !openedFiles && !activeFileId && !rootPath;
    }

    /**
     * @brief Serialize the fields that are set
     */
    QJsonObject toJson() const;

    /**
     * @brief Parse a snapshot, keeping only fields that are present and well-typed
     *
     * Entries of openedFiles without an id are skipped.
     */
    static FileSnapshot fromJson(const QJsonObject& json);
};

/**
 * @brief Replicated subset of LayoutState
 */
struct PANESYNC_EXPORT LayoutSnapshot
{
    std::optional<QVector<Pane>> panes;
    std::optional<QString> activePaneId;
    std::optional<bool> isChatOpen;
    std::optional<bool> isTerminalOpen;

    bool isEmpty() const
    {
        return !panes && !activePaneId && !isChatOpen && !isTerminalOpen;
    }

    QJsonObject toJson() const;
    static LayoutSnapshot fromJson(const QJsonObject& json);
};

} // namespace PaneSync

Q_DECLARE_METATYPE(PaneSync::FileState)
Q_DECLARE_METATYPE(PaneSync::LayoutState)

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include "syncmessage.h"
#include "../core/types.h"

namespace PaneSync {

/**
 * @brief Pure functions producing the replicated subset of each store
 *
 * Output depends only on the input state. Locally built snapshots always
 * set every field.
 */
namespace SnapshotBuilder {

/**
 * @brief Snapshot of the file store: tabs, active tab and project root
 *
 * Tab content is always emptied and initialLine dropped; receivers reload
 * content from disk.
 */
PANESYNC_EXPORT FileSnapshot buildFileSnapshot(const FileState& state);

/**
 * @brief Snapshot of the layout store: panes, active pane, chat and terminal visibility
 */
PANESYNC_EXPORT LayoutSnapshot buildLayoutSnapshot(const LayoutState& state);

PANESYNC_EXPORT SyncMessage buildFileMessage(const QString& origin, const FileState& state);
PANESYNC_EXPORT SyncMessage buildLayoutMessage(const QString& origin, const LayoutState& state);

} // namespace SnapshotBuilder

} // namespace PaneSync

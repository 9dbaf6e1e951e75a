// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace PaneSync {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "panesync.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStore, "panesync.core.store", QtInfoMsg)
Q_LOGGING_CATEGORY(lcLayout, "panesync.core.layout", QtInfoMsg)

// Sync module categories
Q_LOGGING_CATEGORY(lcSync, "panesync.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(lcTransport, "panesync.sync.transport", QtInfoMsg)
Q_LOGGING_CATEGORY(lcHandshake, "panesync.sync.handshake", QtInfoMsg)

// Drag module categories
Q_LOGGING_CATEGORY(lcDrag, "panesync.drag", QtInfoMsg)
Q_LOGGING_CATEGORY(lcDrop, "panesync.drop", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "panesync.config", QtInfoMsg)

// Application categories
Q_LOGGING_CATEGORY(lcApp, "panesync.app", QtInfoMsg)

} // namespace PaneSync

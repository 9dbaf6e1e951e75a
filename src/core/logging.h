// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for PaneSync
 *
 * This file defines Qt logging categories that enable runtime filtering
 * of log messages. Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcSync) << "Debug message";
 *   qCWarning(lcSync) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="panesync.*=true"                 # Enable all
 *   QT_LOGGING_RULES="panesync.*.debug=false"          # Disable debug only
 *   QT_LOGGING_RULES="panesync.sync.*=true"            # Enable sync protocol only
 *   QT_LOGGING_RULES="panesync.drag=true"              # Enable drag arbitration only
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing (per-event, per-message)
 *   qCInfo     - Significant operational events (boot, handshake, peer joined)
 *   qCWarning  - Recoverable errors, invalid input, dropped messages
 *   qCCritical - System failures preventing normal operation
 */

namespace PaneSync {

// Core module - stores, file system, language detection
PANESYNC_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
PANESYNC_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcStore)
PANESYNC_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcLayout)

// Sync module - broadcast, receive, handshake, transport
PANESYNC_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcSync)
PANESYNC_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcTransport)
PANESYNC_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcHandshake)

// Drag module - region arbitration and drop routing
PANESYNC_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDrag)
PANESYNC_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDrop)

// Configuration module - settings loading/saving
PANESYNC_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

// Application shell - window process, command line, host window
PANESYNC_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcApp)

} // namespace PaneSync

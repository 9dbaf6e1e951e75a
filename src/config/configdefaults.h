// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync.h" // Generated from panesync.kcfg via KConfigXT

#include <QString>

namespace PaneSync {

/**
 * @brief Provides static access to default configuration values
 *
 * Wraps the KConfigXT-generated PaneSyncConfig class. The .kcfg file is the
 * single source of truth for defaults and ranges; this class only exposes
 * what the generator produced.
 *
 * Usage:
 *   int grace = ConfigDefaults::handshakeGraceMs();  // 200 (from .kcfg)
 */
class ConfigDefaults
{
public:
    // ═══════════════════════════════════════════════════════════════════════════
    // Sync
    // ═══════════════════════════════════════════════════════════════════════════

    static bool syncEnabled() { return instance().defaultEnabledValue(); }
    static int handshakeGraceMs() { return instance().defaultHandshakeGraceMsValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Drag and drop
    // ═══════════════════════════════════════════════════════════════════════════

    static int pollIntervalMs() { return instance().defaultPollIntervalMsValue(); }
    static QString chatRegionMarker() { return instance().defaultChatRegionMarkerValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Notifications
    // ═══════════════════════════════════════════════════════════════════════════

    static bool usePlasmaOsd() { return instance().defaultUsePlasmaOsdValue(); }

private:
    // Lazily-initialized singleton instance
    static PaneSyncConfig& instance()
    {
        static PaneSyncConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace PaneSync

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include <QJsonObject>
#include <QString>
#include <optional>

namespace PaneSync {

/**
 * @brief A store snapshot published on the "sync-state" channel
 *
 * Wire form: { "origin": s, "store": "file" | "layout", "state": {...} }
 */
struct PANESYNC_EXPORT SyncMessage {
    QString origin;
    QString store;
    QJsonObject state;

    QJsonObject toJson() const;

    /**
     * @brief Parse a message envelope
     * @return std::nullopt if origin or store is missing, or state is not an object
     */
    static std::optional<SyncMessage> fromJson(const QJsonObject& json);
};

/**
 * @brief Readiness announcement published once on the "window-ready" channel
 */
struct PANESYNC_EXPORT ReadyMessage {
    QString origin;

    QJsonObject toJson() const;
    static std::optional<ReadyMessage> fromJson(const QJsonObject& json);
};

} // namespace PaneSync

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include <QObject>
#include <QPointF>
#include <optional>

namespace PaneSync {

/**
 * @brief Last known pointer position in window coordinates
 *
 * Written by the DragRegionArbiter on every pointer and drag event, read by
 * anything that needs to know where a drop without coordinates happened.
 * Empty until the first pointer event.
 */
class PANESYNC_EXPORT CursorPositionCell : public QObject
{
    Q_OBJECT

public:
    explicit CursorPositionCell(QObject* parent = nullptr);

    std::optional<QPointF> position() const { return m_position; }
    bool hasPosition() const { return m_position.has_value(); }

    void set(const QPointF& position);
    void clear();

Q_SIGNALS:
    void changed(const QPointF& position);

private:
    std::optional<QPointF> m_position;
};

/**
 * @brief Whether a pending external drop would land on the chat region
 *
 * Only the DragRegionArbiter writes the flag. The file drop router and the
 * chat attachment consumer read it when the native drop arrives.
 *
 * The flag also remembers whether it was written at all during the current
 * drag interaction; endInteraction() forces it to false and forgets that.
 */
class PANESYNC_EXPORT DragOverChatFlag : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool value READ value NOTIFY changed)

public:
    explicit DragOverChatFlag(QObject* parent = nullptr);

    bool value() const { return m_value; }
    bool wasSetThisInteraction() const { return m_setThisInteraction; }

    void set(bool value);
    void endInteraction();

Q_SIGNALS:
    void changed(bool value);

private:
    bool m_value = false;
    bool m_setThisInteraction = false;
};

} // namespace PaneSync

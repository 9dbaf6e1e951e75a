// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dragstate.h"

namespace PaneSync {

CursorPositionCell::CursorPositionCell(QObject* parent)
    : QObject(parent)
{
}

void CursorPositionCell::set(const QPointF& position)
{
    if (m_position && *m_position == position) {
        return;
    }
    m_position = position;
    Q_EMIT changed(position);
}

void CursorPositionCell::clear()
{
    m_position.reset();
}

DragOverChatFlag::DragOverChatFlag(QObject* parent)
    : QObject(parent)
{
}

void DragOverChatFlag::set(bool value)
{
    m_setThisInteraction = true;
    if (m_value == value) {
        return;
    }
    m_value = value;
    Q_EMIT changed(value);
}

void DragOverChatFlag::endInteraction()
{
    m_setThisInteraction = false;
    if (m_value) {
        m_value = false;
        Q_EMIT changed(false);
    }
}

} // namespace PaneSync

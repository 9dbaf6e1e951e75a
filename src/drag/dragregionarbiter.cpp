// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dragregionarbiter.h"
#include "dragstate.h"
#include "../core/constants.h"
#include "../core/interfaces.h"
#include "../core/logging.h"
#include <QDragMoveEvent>
#include <QDropEvent>
#include <QEvent>
#include <QHoverEvent>
#include <QMetaObject>
#include <QMouseEvent>

namespace PaneSync {

DragRegionArbiter::DragRegionArbiter(IRegionHitTester* hitTester, CursorPositionCell* cursor, DragOverChatFlag* flag,
                                     QObject* parent)
    : QObject(parent)
    , m_hitTester(hitTester)
    , m_cursor(cursor)
    , m_flag(flag)
{
    m_pollTimer.setInterval(Defaults::DragPollIntervalMs);
    connect(&m_pollTimer, &QTimer::timeout, this, &DragRegionArbiter::recompute);
}

DragRegionArbiter::~DragRegionArbiter()
{
    uninstall();
}

void DragRegionArbiter::setPollIntervalMs(int ms)
{
    m_pollTimer.setInterval(qMax(1, ms));
}

void DragRegionArbiter::install(QObject* target)
{
    uninstall();
    if (!target) {
        return;
    }
    m_target = target;
    m_target->installEventFilter(this);
    // Polls for the whole install lifetime; drag events may never arrive
    m_pollTimer.start();
    qCDebug(lcDrag) << "Drag arbitration installed on" << target;
}

void DragRegionArbiter::uninstall()
{
    if (m_target) {
        m_target->removeEventFilter(this);
    }
    m_target.clear();
    m_pollTimer.stop();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Event handling
// ═══════════════════════════════════════════════════════════════════════════════

void DragRegionArbiter::handlePointerMove(const QPointF& position)
{
    if (m_cursor) {
        m_cursor->set(position);
    }
}

void DragRegionArbiter::handleDragMove(const QPointF& position)
{
    if (!m_dragInProgress) {
        m_dragInProgress = true;
        qCDebug(lcDrag) << "External drag entered at" << position;
        Q_EMIT dragStarted();
        Q_EMIT dragInProgressChanged();
    }
    handlePointerMove(position);
    recompute();
}

void DragRegionArbiter::handleDragEnd()
{
    if (m_flag) {
        m_flag->endInteraction();
    }
    if (m_dragInProgress) {
        m_dragInProgress = false;
        qCDebug(lcDrag) << "External drag ended";
        Q_EMIT dragEnded();
        Q_EMIT dragInProgressChanged();
    }
}

bool DragRegionArbiter::recompute()
{
    if (!m_flag) {
        return false;
    }
    if (!m_cursor || !m_cursor->hasPosition() || !m_hitTester) {
        m_flag->set(false);
        return false;
    }

    const bool inChat = m_hitTester->isInChatRegion(*m_cursor->position());
    if (inChat != m_flag->value()) {
        qCDebug(lcDrag) << "Drag over chat:" << inChat << "at" << *m_cursor->position();
    }
    m_flag->set(inChat);
    return inChat;
}

bool DragRegionArbiter::resolveForDrop()
{
    if (!m_flag) {
        return false;
    }
    if (!m_flag->wasSetThisInteraction()) {
        return recompute();
    }
    return m_flag->value();
}

bool DragRegionArbiter::eventFilter(QObject* watched, QEvent* event)
{
    Q_UNUSED(watched)

    switch (event->type()) {
    case QEvent::MouseMove:
        handlePointerMove(static_cast<QMouseEvent*>(event)->position());
        break;
    case QEvent::HoverMove:
        handlePointerMove(static_cast<QHoverEvent*>(event)->position());
        break;
    case QEvent::DragEnter:
    case QEvent::DragMove: {
        // Accept every time or the window stops receiving drag moves and the drop
        auto* dragEvent = static_cast<QDragMoveEvent*>(event);
        dragEvent->acceptProposedAction();
        handleDragMove(dragEvent->position());
        break;
    }
    case QEvent::DragLeave:
        handleDragEnd();
        break;
    case QEvent::Drop:
        // Drop consumers read the flag synchronously; end the interaction afterwards
        handlePointerMove(static_cast<QDropEvent*>(event)->position());
        QMetaObject::invokeMethod(this, &DragRegionArbiter::handleDragEnd, Qt::QueuedConnection);
        break;
    default:
        break;
    }
    return false;
}

} // namespace PaneSync

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include <QObject>
#include <QPointF>
#include <QPointer>
#include <QTimer>

namespace PaneSync {

class CursorPositionCell;
class DragOverChatFlag;
class IRegionHitTester;

/**
 * @brief Decides whether a pending external drop targets the chat region
 *
 * Responsible for:
 * - Recording the last pointer position from mouse, hover and drag events
 * - Accepting drag-enter and drag-move so the window keeps receiving them
 * - Re-running the hit test on a fixed cadence for as long as it is installed
 * - Forcing the flag to false when the drag ends
 *
 * Event-driven updates and the poll timer share recompute(). The arbiter
 * never touches file or layout state.
 */
class PANESYNC_EXPORT DragRegionArbiter : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool dragInProgress READ isDragInProgress NOTIFY dragInProgressChanged)

public:
    DragRegionArbiter(IRegionHitTester* hitTester, CursorPositionCell* cursor, DragOverChatFlag* flag,
                      QObject* parent = nullptr);
    ~DragRegionArbiter() override;

    int pollIntervalMs() const { return m_pollTimer.interval(); }
    void setPollIntervalMs(int ms);

    bool isDragInProgress() const { return m_dragInProgress; }

    /**
     * @brief Watch pointer and drag events of @p target (normally the QQuickWindow)
     */
    void install(QObject* target);
    void uninstall();

    // Event entry points, also used directly by tests
    void handlePointerMove(const QPointF& position);
    void handleDragMove(const QPointF& position);
    void handleDragEnd();

    /**
     * @brief Hit-test the last known position and store the result in the flag
     * @return New flag value; false if no position is known yet
     */
    bool recompute();

    /**
     * @brief Flag value for a drop that is being dispatched now
     *
     * Re-derives the flag once from the last known position if nothing set
     * it during this interaction.
     */
    bool resolveForDrop();

    bool eventFilter(QObject* watched, QEvent* event) override;

Q_SIGNALS:
    void dragStarted();
    void dragEnded();
    void dragInProgressChanged();

private:
    IRegionHitTester* m_hitTester;
    QPointer<CursorPositionCell> m_cursor;
    QPointer<DragOverChatFlag> m_flag;
    QPointer<QObject> m_target;
    QTimer m_pollTimer;
    bool m_dragInProgress = false;
};

} // namespace PaneSync

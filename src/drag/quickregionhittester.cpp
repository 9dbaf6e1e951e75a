// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "quickregionhittester.h"

namespace PaneSync {

QuickRegionHitTester::QuickRegionHitTester(QQuickItem* root, const QString& markerName)
    : m_root(root)
    , m_markerName(markerName)
{
}

void QuickRegionHitTester::setRoot(QQuickItem* root)
{
    m_root = root;
}

void QuickRegionHitTester::setMarkerName(const QString& markerName)
{
    m_markerName = markerName;
}

bool QuickRegionHitTester::isMarker(const QQuickItem* item) const
{
    return item && !m_markerName.isEmpty() && item->objectName() == m_markerName;
}

QQuickItem* QuickRegionHitTester::deepestItemAt(const QPointF& scenePoint) const
{
    if (!m_root || !m_root->isVisible()) {
        return nullptr;
    }

    QPointF local = m_root->mapFromScene(scenePoint);
    if (!m_root->contains(local)) {
        return nullptr;
    }

    QQuickItem* current = m_root;
    while (QQuickItem* child = current->childAt(local.x(), local.y())) {
        current = child;
        local = current->mapFromScene(scenePoint);
    }
    return current;
}

QQuickItem* QuickRegionHitTester::markerItem() const
{
    if (!m_root || m_markerName.isEmpty()) {
        return nullptr;
    }
    if (isMarker(m_root)) {
        return m_root;
    }

    // Walk visual children; QML does not always parent items as QObjects
    QList<QQuickItem*> pending = m_root->childItems();
    while (!pending.isEmpty()) {
        QQuickItem* item = pending.takeFirst();
        if (isMarker(item)) {
            return item;
        }
        pending.append(item->childItems());
    }
    return nullptr;
}

bool QuickRegionHitTester::isInChatRegion(const QPointF& point) const
{
    for (QQuickItem* item = deepestItemAt(point); item; item = item->parentItem()) {
        if (isMarker(item)) {
            return true;
        }
    }

    QQuickItem* marker = markerItem();
    if (!marker || !marker->isVisible()) {
        return false;
    }
    const QRectF bounds = marker->mapRectToScene(QRectF(0, 0, marker->width(), marker->height()));
    return bounds.contains(point);
}

} // namespace PaneSync

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include "../core/interfaces.h"
#include <QPointer>
#include <QQuickItem>
#include <QString>

namespace PaneSync {

/**
 * @brief Chat region hit test over a Qt Quick item tree
 *
 * Finds the deepest visible item under the point, then walks up its parent
 * items looking for one whose objectName is the marker. If the walk finds
 * nothing, the marker item's scene bounding rectangle decides.
 *
 * Points are in scene (window) coordinates of the root item.
 */
class PANESYNC_EXPORT QuickRegionHitTester : public IRegionHitTester
{
public:
    QuickRegionHitTester(QQuickItem* root, const QString& markerName);

    void setRoot(QQuickItem* root);
    void setMarkerName(const QString& markerName);
    QString markerName() const { return m_markerName; }

    bool isInChatRegion(const QPointF& point) const override;

    /**
     * @brief Deepest visible item containing @p scenePoint, or nullptr
     */
    QQuickItem* deepestItemAt(const QPointF& scenePoint) const;

    /**
     * @brief The marker item, searched in the root's subtree
     */
    QQuickItem* markerItem() const;

private:
    bool isMarker(const QQuickItem* item) const;

    QPointer<QQuickItem> m_root;
    QString m_markerName;
};

} // namespace PaneSync

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QQuickItem>
#include <QTest>

#include "drag/quickregionhittester.h"

using namespace PaneSync;

/**
 * @brief Unit tests for QuickRegionHitTester over a plain QQuickItem tree
 *
 * Layout under test (800x600):
 * - editor: x 0..600
 * - chat panel (marker): x 600..800, with a nested message list
 *
 * Tests cover:
 * - Points inside nested chat items resolve to the marker
 * - Points in the editor or outside the window do not
 * - Hidden chat panel never matches
 * - Overlays above the chat fall back to the marker's bounds
 */
class TestQuickHitTester : public QObject
{
    Q_OBJECT

private:
    static QQuickItem* makeItem(QQuickItem* parent, qreal x, qreal y, qreal w, qreal h)
    {
        auto* item = new QQuickItem(parent);
        item->setPosition(QPointF(x, y));
        item->setSize(QSizeF(w, h));
        return item;
    }

private Q_SLOTS:

    void init()
    {
        m_root = new QQuickItem;
        m_root->setSize(QSizeF(800, 600));
        m_editor = makeItem(m_root, 0, 0, 600, 600);
        m_chat = makeItem(m_root, 600, 0, 200, 600);
        m_chat->setObjectName(QStringLiteral("chat-panel"));
        m_messages = makeItem(m_chat, 10, 40, 180, 500);
    }

    void cleanup()
    {
        delete m_root;
        m_root = nullptr;
    }

    void test_pointInNestedChatItem_matches()
    {
        QuickRegionHitTester tester(m_root, QStringLiteral("chat-panel"));
        QCOMPARE(tester.deepestItemAt(QPointF(700, 300)), m_messages);
        QVERIFY(tester.isInChatRegion(QPointF(700, 300)));
        QVERIFY(tester.isInChatRegion(QPointF(605, 5)));
    }

    void test_pointOutsideChat_noMatch()
    {
        QuickRegionHitTester tester(m_root, QStringLiteral("chat-panel"));
        QCOMPARE(tester.deepestItemAt(QPointF(100, 100)), m_editor);
        QVERIFY(!tester.isInChatRegion(QPointF(100, 100)));
        QVERIFY(!tester.isInChatRegion(QPointF(900, 100)));
        QVERIFY(!tester.isInChatRegion(QPointF(-1, -1)));
    }

    void test_hiddenChat_neverMatches()
    {
        QuickRegionHitTester tester(m_root, QStringLiteral("chat-panel"));
        m_chat->setVisible(false);
        QVERIFY(!tester.isInChatRegion(QPointF(700, 300)));
    }

    void test_overlayAboveChat_usesMarkerBounds()
    {
        QQuickItem* overlay = makeItem(m_root, 0, 0, 800, 600);
        overlay->setZ(10);
        QuickRegionHitTester tester(m_root, QStringLiteral("chat-panel"));

        QCOMPARE(tester.deepestItemAt(QPointF(700, 300)), overlay);
        QVERIFY(tester.isInChatRegion(QPointF(700, 300)));
        QVERIFY(!tester.isInChatRegion(QPointF(300, 300)));
    }

    void test_markerRename_andMissingRoot()
    {
        QuickRegionHitTester tester(m_root, QStringLiteral("assistant"));
        QVERIFY(!tester.markerItem());
        QVERIFY(!tester.isInChatRegion(QPointF(700, 300)));

        tester.setMarkerName(QStringLiteral("chat-panel"));
        QCOMPARE(tester.markerItem(), m_chat);

        tester.setRoot(nullptr);
        QVERIFY(!tester.isInChatRegion(QPointF(700, 300)));
    }

private:
    QQuickItem* m_root = nullptr;
    QQuickItem* m_editor = nullptr;
    QQuickItem* m_chat = nullptr;
    QQuickItem* m_messages = nullptr;
};

QTEST_MAIN(TestQuickHitTester)
#include "test_quick_hit_tester.moc"

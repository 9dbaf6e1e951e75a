// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QDBusConnection>
#include <QRegularExpression>
#include <QSignalSpy>
#include <QTest>

#include "core/constants.h"
#include "dbus/dbuseventtransport.h"
#include "mocks.h"
#include "sync/syncmessage.h"

using namespace PaneSync;
using namespace PaneSync::Testing;

/**
 * @brief Unit tests for EventTransport listener bookkeeping
 *
 * Tests cover:
 * - Teardowns remove exactly their own handler and are safe to call twice
 * - Typed listeners drop payloads that do not parse
 * - A handler may tear itself down while being dispatched
 * - Delivery through the hub reaches every window, the publisher included
 * - DBusEventTransport reports itself unavailable without a bus connection
 */
class TestEventTransport : public QObject
{
    Q_OBJECT

private Q_SLOTS:

    void test_listen_teardownRemovesOnlyOwnHandler()
    {
        FakeTransport transport(QStringLiteral("window-a"), nullptr);
        int first = 0;
        int second = 0;

        Teardown unlistenFirst = transport.listen(Channel::SyncState, [&first](const QJsonObject&) {
            ++first;
        });
        Teardown unlistenSecond = transport.listen(Channel::SyncState, [&second](const QJsonObject&) {
            ++second;
        });
        QCOMPARE(transport.listenerCount(Channel::SyncState), 2);

        transport.inject(Channel::SyncState, QJsonObject());
        unlistenFirst();
        unlistenFirst();
        transport.inject(Channel::SyncState, QJsonObject());

        QCOMPARE(first, 1);
        QCOMPARE(second, 2);
        QCOMPARE(transport.listenerCount(Channel::SyncState), 1);

        unlistenSecond();
        QCOMPARE(transport.listenerCount(Channel::SyncState), 0);
    }

    void test_listen_otherChannelsNotDelivered()
    {
        FakeTransport transport(QStringLiteral("window-a"), nullptr);
        int calls = 0;
        const Teardown unlisten = transport.listen(Channel::WindowReady, [&calls](const QJsonObject&) {
            ++calls;
        });
        transport.inject(Channel::SyncState, QJsonObject());
        QCOMPARE(calls, 0);
        unlisten();
    }

    void test_typedListen_dropsMalformedPayload()
    {
        FakeTransport transport(QStringLiteral("window-a"), nullptr);
        QStringList origins;
        const Teardown unlisten = transport.listen<ReadyMessage>(
            Channel::WindowReady, std::function<void(const ReadyMessage&)>([&origins](const ReadyMessage& message) {
                origins.append(message.origin);
            }));

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Dropping malformed message")));
        transport.inject(Channel::WindowReady, QJsonObject{{QStringLiteral("origin"), 5}});
        transport.inject(Channel::WindowReady, ReadyMessage{QStringLiteral("window-b")}.toJson());

        QCOMPARE(origins, QStringList{QStringLiteral("window-b")});
        unlisten();
    }

    void test_dispatch_handlerTearsItselfDown()
    {
        FakeTransport transport(QStringLiteral("window-a"), nullptr);
        int calls = 0;
        Teardown unlisten;
        unlisten = transport.listen(Channel::SyncState, [&calls, &unlisten](const QJsonObject&) {
            ++calls;
            unlisten();
        });

        transport.inject(Channel::SyncState, QJsonObject());
        transport.inject(Channel::SyncState, QJsonObject());

        QCOMPARE(calls, 1);
        QCOMPARE(transport.listenerCount(Channel::SyncState), 0);
    }

    void test_teardown_afterTransportDestroyed_isHarmless()
    {
        Teardown unlisten;
        {
            FakeTransport transport(QStringLiteral("window-a"), nullptr);
            unlisten = transport.listen(Channel::SyncState, [](const QJsonObject&) {});
        }
        unlisten();
        QVERIFY(true);
    }

    void test_hub_deliversToEveryWindowAsynchronously()
    {
        FakeEventHub hub;
        FakeTransport a(QStringLiteral("window-a"), &hub);
        FakeTransport b(QStringLiteral("window-b"), &hub);
        int receivedA = 0;
        int receivedB = 0;
        const Teardown ua = a.listen(Channel::SyncState, [&receivedA](const QJsonObject&) {
            ++receivedA;
        });
        const Teardown ub = b.listen(Channel::SyncState, [&receivedB](const QJsonObject&) {
            ++receivedB;
        });

        QVERIFY(a.publish(Channel::SyncState, QJsonObject()));
        QCOMPARE(receivedA, 0);

        QTRY_COMPARE(receivedA, 1);
        QTRY_COMPARE(receivedB, 1);
        ua();
        ub();
    }

    void test_dbusTransport_withoutBus_unavailable()
    {
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Cannot connect to session D-Bus")));
        DBusEventTransport transport(QStringLiteral("window-x"),
                                     QDBusConnection(QStringLiteral("panesync-test-no-such-connection")));

        QVERIFY(!transport.isAvailable());
        QCOMPARE(transport.windowLabel(), QStringLiteral("window-x"));
        QVERIFY(!transport.publish(Channel::WindowReady, ReadyMessage{QStringLiteral("window-x")}));
    }
};

QTEST_MAIN(TestEventTransport)
#include "test_event_transport.moc"

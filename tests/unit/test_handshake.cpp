// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QRegularExpression>
#include <QSignalSpy>
#include <QTest>

#include "core/constants.h"
#include "core/filestore.h"
#include "core/layoutstore.h"
#include "mocks.h"
#include "sync/broadcasttrigger.h"
#include "sync/handshakecoordinator.h"
#include "sync/syncreceiver.h"
#include "sync/syncsession.h"

using namespace PaneSync;
using namespace PaneSync::Testing;

namespace {

/**
 * @brief One window: its stores, its transport and its sync session
 */
struct TestWindow {
    TestWindow(const QString& label, FakeEventHub* hub, IFileSystem* fs, int graceMs)
        : transport(label, hub)
        , fileStore(fs)
        , session(&transport, &fileStore, &layoutStore)
    {
        session.setHandshakeGraceMs(graceMs);
    }

    FakeTransport transport;
    FileStore fileStore;
    LayoutStore layoutStore;
    SyncSession session;
};

}

/**
 * @brief Unit tests for HandshakeCoordinator and SyncSession
 *
 * Tests cover:
 * - A joining window receives the full state of a running window
 * - Tabs arrive without content and are then reloaded from disk
 * - Several announcements within the grace delay get one reply
 * - Self-originated announcements are ignored
 * - Booting -> Announced -> Steady transitions
 * - Teardown cancels a pending reply and unsubscribes
 * - A torn-down coordinator or session can be started again
 * - An unavailable transport disables sync without failing
 */
class TestHandshake : public QObject
{
    Q_OBJECT

private Q_SLOTS:

    // ═══════════════════════════════════════════════════════════════════════════
    // Two windows
    // ═══════════════════════════════════════════════════════════════════════════

    void test_joiningWindow_receivesFullState()
    {
        FakeFileSystem fs;
        fs.files.insert(QStringLiteral("/proj/foo.ts"), QStringLiteral("export const foo = 1;"));
        FakeEventHub hub;

        TestWindow a(QStringLiteral("window-a"), &hub, &fs, 10);
        OpenedFile foo;
        foo.id = QStringLiteral("f1");
        foo.path = QStringLiteral("/proj/foo.ts");
        foo.name = QStringLiteral("foo.ts");
        foo.language = QStringLiteral("typescript");
        foo.content = QStringLiteral("export const foo = 1;");
        a.fileStore.openFile(foo);
        const QString second = a.layoutStore.splitPane(SplitDirection::Horizontal, QStringLiteral("pane-1"));
        a.layoutStore.resizePane(QStringLiteral("pane-1"), 60.0);

        const Teardown stopA = a.session.initialize();
        QVERIFY(stopA);
        QCOMPARE(a.session.handshake()->state(), HandshakeCoordinator::State::Announced);
        QTest::qWait(30);

        TestWindow b(QStringLiteral("window-b"), &hub, &fs, 10);
        QString contentOnArrival = QStringLiteral("<never arrived>");
        connect(&b.fileStore, &FileStore::stateChanged, &b.fileStore,
                [&contentOnArrival](const FileState& previous, const FileState& next) {
                    const OpenedFile* file = next.fileById(QStringLiteral("f1"));
                    if (file && !previous.fileById(QStringLiteral("f1"))) {
                        contentOnArrival = file->content;
                    }
                });
        QSignalSpy replySpy(a.session.handshake(), &HandshakeCoordinator::fullStateBroadcast);

        const Teardown stopB = b.session.initialize();

        QTRY_COMPARE(b.layoutStore.paneCount(), 2);
        QCOMPARE(replySpy.count(), 1);
        QCOMPARE(b.layoutStore.state().panes.at(0).size, 60.0);
        QCOMPARE(b.layoutStore.state().panes.at(1).size, 40.0);
        QCOMPARE(b.layoutStore.state().panes.at(1).id, second);

        QTRY_COMPARE(b.fileStore.openedFileCount(), 1);
        QCOMPARE(contentOnArrival, QString());
        QCOMPARE(b.fileStore.state().openedFiles.constFirst().name, QStringLiteral("foo.ts"));
        QTRY_COMPARE(b.fileStore.state().fileById(QStringLiteral("f1"))->content,
                     QStringLiteral("export const foo = 1;"));

        // Traffic in both directions moves both windows to Steady
        QCOMPARE(a.session.handshake()->state(), HandshakeCoordinator::State::Steady);
        QCOMPARE(b.session.handshake()->state(), HandshakeCoordinator::State::Steady);

        // B never echoed what it received
        QCOMPARE(b.transport.sentOn(Channel::SyncState), 0);

        stopB();
        stopA();
    }

    void test_twoWindows_changesReplicate()
    {
        FakeFileSystem fs;
        FakeEventHub hub;
        TestWindow a(QStringLiteral("window-a"), &hub, &fs, 0);
        TestWindow b(QStringLiteral("window-b"), &hub, &fs, 0);
        const Teardown stopA = a.session.initialize();
        const Teardown stopB = b.session.initialize();
        QTest::qWait(20);

        a.layoutStore.toggleTerminal();
        QTRY_VERIFY(b.layoutStore.isTerminalOpen());

        b.fileStore.setRootPath(QStringLiteral("/elsewhere"));
        QTRY_COMPARE(a.fileStore.rootPath(), QStringLiteral("/elsewhere"));

        stopA();
        stopB();
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Single coordinator
    // ═══════════════════════════════════════════════════════════════════════════

    void test_announcements_coalesced()
    {
        FakeTransport transport(QStringLiteral("window-a"), nullptr);
        FileStore fileStore(nullptr);
        LayoutStore layoutStore;
        BroadcastTrigger trigger(&transport, &fileStore, &layoutStore);
        HandshakeCoordinator handshake(&transport, &trigger);
        handshake.setGraceMs(30);
        const Teardown keepAlive = transport.listen(Channel::SyncState, [](const QJsonObject&) {});

        const Teardown stop = handshake.start();
        QCOMPARE(transport.sentOn(Channel::WindowReady), 1);

        QSignalSpy announced(&handshake, &HandshakeCoordinator::peerAnnounced);
        QSignalSpy replied(&handshake, &HandshakeCoordinator::fullStateBroadcast);
        transport.inject(Channel::WindowReady, ReadyMessage{QStringLiteral("window-b")}.toJson());
        transport.inject(Channel::WindowReady, ReadyMessage{QStringLiteral("window-c")}.toJson());
        QVERIFY(handshake.isReplyPending());
        QCOMPARE(announced.count(), 2);

        QVERIFY(replied.wait(1000));
        QTest::qWait(60);
        QCOMPARE(replied.count(), 1);
        // One file and one layout snapshot
        QCOMPARE(transport.sentOn(Channel::SyncState), 2);

        stop();
        keepAlive();
    }

    void test_selfAnnouncement_ignored()
    {
        FakeTransport transport(QStringLiteral("window-a"), nullptr);
        FileStore fileStore(nullptr);
        LayoutStore layoutStore;
        BroadcastTrigger trigger(&transport, &fileStore, &layoutStore);
        HandshakeCoordinator handshake(&transport, &trigger);
        const Teardown keepAlive = transport.listen(Channel::SyncState, [](const QJsonObject&) {});

        const Teardown stop = handshake.start();
        transport.inject(Channel::WindowReady, ReadyMessage{QStringLiteral("window-a")}.toJson());

        QVERIFY(!handshake.isReplyPending());
        QCOMPARE(handshake.state(), HandshakeCoordinator::State::Announced);

        stop();
        keepAlive();
    }

    void test_stateTransitions()
    {
        FakeTransport transport(QStringLiteral("window-a"), nullptr);
        HandshakeCoordinator handshake(&transport, nullptr);
        QCOMPARE(handshake.state(), HandshakeCoordinator::State::Booting);

        // Before announcing, peer announcements are not answered
        transport.inject(Channel::WindowReady, ReadyMessage{QStringLiteral("window-b")}.toJson());
        QVERIFY(!handshake.isReplyPending());

        QSignalSpy stateSpy(&handshake, &HandshakeCoordinator::stateChanged);
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Announcing before anything listens")));
        const Teardown stop = handshake.start();
        QCOMPARE(handshake.state(), HandshakeCoordinator::State::Announced);

        handshake.notePeerTraffic(QStringLiteral("window-a"));
        QCOMPARE(handshake.state(), HandshakeCoordinator::State::Announced);

        handshake.notePeerTraffic(QStringLiteral("window-b"));
        QCOMPARE(handshake.state(), HandshakeCoordinator::State::Steady);
        QCOMPARE(stateSpy.count(), 2);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("start\\(\\) called twice")));
        QVERIFY(!handshake.start());
        QCOMPARE(transport.sentOn(Channel::WindowReady), 1);

        stop();
    }

    void test_teardown_cancelsPendingReply()
    {
        FakeTransport transport(QStringLiteral("window-a"), nullptr);
        FileStore fileStore(nullptr);
        LayoutStore layoutStore;
        BroadcastTrigger trigger(&transport, &fileStore, &layoutStore);
        HandshakeCoordinator handshake(&transport, &trigger);
        handshake.setGraceMs(20);
        const Teardown keepAlive = transport.listen(Channel::SyncState, [](const QJsonObject&) {});

        const Teardown stop = handshake.start();
        transport.inject(Channel::WindowReady, ReadyMessage{QStringLiteral("window-b")}.toJson());
        QVERIFY(handshake.isReplyPending());

        stop();
        QVERIFY(!handshake.isReplyPending());
        QCOMPARE(transport.listenerCount(Channel::WindowReady), 0);
        QTest::qWait(50);
        QCOMPARE(transport.sentOn(Channel::SyncState), 0);
        QCOMPARE(handshake.state(), HandshakeCoordinator::State::Booting);

        keepAlive();
    }

    void test_restartAfterTeardown_announcesAgain()
    {
        FakeTransport transport(QStringLiteral("window-a"), nullptr);
        HandshakeCoordinator handshake(&transport, nullptr);
        const Teardown keepAlive = transport.listen(Channel::SyncState, [](const QJsonObject&) {});

        Teardown stop = handshake.start();
        stop();

        stop = handshake.start();
        QVERIFY(stop);
        QCOMPARE(handshake.state(), HandshakeCoordinator::State::Announced);
        QCOMPARE(transport.sentOn(Channel::WindowReady), 2);
        QCOMPARE(transport.listenerCount(Channel::WindowReady), 1);

        stop();
        keepAlive();
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Session lifecycle
    // ═══════════════════════════════════════════════════════════════════════════

    void test_session_unavailableTransport_disabled()
    {
        FakeTransport transport(QStringLiteral("window-a"), nullptr);
        transport.available = false;
        FileStore fileStore(nullptr);
        LayoutStore layoutStore;
        SyncSession session(&transport, &fileStore, &layoutStore);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Event bus unavailable")));
        const Teardown teardown = session.initialize();

        QVERIFY(!teardown);
        QVERIFY(!session.isActive());
        QCOMPARE(transport.sent.size(), 0);

        // Local operations keep working
        layoutStore.splitPane(SplitDirection::Horizontal);
        QCOMPARE(layoutStore.paneCount(), 2);
    }

    void test_session_teardownUnsubscribesEverything()
    {
        FakeTransport transport(QStringLiteral("window-a"), nullptr);
        FileStore fileStore(nullptr);
        LayoutStore layoutStore;
        SyncSession session(&transport, &fileStore, &layoutStore);

        const Teardown teardown = session.initialize();
        QVERIFY(session.isActive());
        QCOMPARE(transport.listenerCount(Channel::SyncState), 1);
        QCOMPARE(transport.listenerCount(Channel::WindowReady), 1);

        teardown();
        QVERIFY(!session.isActive());
        QCOMPARE(transport.listenerCount(Channel::SyncState), 0);
        QCOMPARE(transport.listenerCount(Channel::WindowReady), 0);

        transport.sent.clear();
        layoutStore.toggleChat();
        QCOMPARE(transport.sent.size(), 0);
    }

    void test_session_reinitializeAfterTeardown()
    {
        FakeTransport transport(QStringLiteral("window-a"), nullptr);
        FileStore fileStore(nullptr);
        LayoutStore layoutStore;
        SyncSession session(&transport, &fileStore, &layoutStore);

        const Teardown first = session.initialize();
        first();
        QVERIFY(!session.isActive());

        const Teardown second = session.initialize();
        QVERIFY(second);
        QVERIFY(session.isActive());
        QCOMPARE(transport.listenerCount(Channel::SyncState), 1);
        QCOMPARE(transport.listenerCount(Channel::WindowReady), 1);
        QCOMPARE(transport.sentOn(Channel::WindowReady), 2);

        // Broadcasting resumes as well
        transport.sent.clear();
        layoutStore.toggleChat();
        QCOMPARE(transport.sentOn(Channel::SyncState), 1);

        second();
        QCOMPARE(transport.listenerCount(Channel::WindowReady), 0);
    }
};

QTEST_MAIN(TestHandshake)
#include "test_handshake.moc"

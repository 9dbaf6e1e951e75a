// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QRegularExpression>
#include <QSignalSpy>
#include <QTest>

#include "core/fileactions.h"
#include "core/filestore.h"
#include "core/layoutstore.h"
#include "mocks.h"

using namespace PaneSync;
using namespace PaneSync::Testing;

/**
 * @brief Unit tests for FileStore tab handling and FileActions
 *
 * Tests cover:
 * - Re-opening a path re-activates the existing tab
 * - Content replacement rules when both sides are dirty
 * - Closing the active tab activates the last remaining one
 * - Queued reload from disk, skipped for dirty tabs, failing for missing files
 * - File tree refresh from the project root
 * - syncState keeping local content when the snapshot carries none
 * - FileActions opening a file into the active pane
 */
class TestFileStore : public QObject
{
    Q_OBJECT

private:
    static OpenedFile makeFile(const QString& path, const QString& content = QString())
    {
        OpenedFile file;
        file.path = path;
        file.content = content;
        return file;
    }

private Q_SLOTS:

    // ═══════════════════════════════════════════════════════════════════════════
    // Tabs
    // ═══════════════════════════════════════════════════════════════════════════

    void test_openFile_assignsIdAndName()
    {
        FileStore store(nullptr);
        QSignalSpy spy(&store, &FileStore::stateChanged);

        const QString id = store.openFile(makeFile(QStringLiteral("/src/main.cpp"), QStringLiteral("int main();")));

        QVERIFY(!id.isEmpty());
        QCOMPARE(store.activeFileId(), id);
        QCOMPARE(store.openedFileCount(), 1);
        QCOMPARE(store.state().fileById(id)->name, QStringLiteral("main.cpp"));
        QCOMPARE(spy.count(), 1);
    }

    void test_openFile_samePath_reactivatesExistingTab()
    {
        FileStore store(nullptr);
        const QString first = store.openFile(makeFile(QStringLiteral("/a.ts"), QStringLiteral("a")));
        const QString second = store.openFile(makeFile(QStringLiteral("/b.ts"), QStringLiteral("b")));
        QCOMPARE(store.activeFileId(), second);

        const QString again = store.openFile(makeFile(QStringLiteral("/a.ts"), QStringLiteral("a2")));

        QCOMPARE(again, first);
        QCOMPARE(store.openedFileCount(), 2);
        QCOMPARE(store.activeFileId(), first);
        QCOMPARE(store.state().fileById(first)->content, QStringLiteral("a2"));
    }

    void test_openFile_bothDirty_keepsLocalEdits()
    {
        FileStore store(nullptr);
        const QString id = store.openFile(makeFile(QStringLiteral("/a.ts"), QStringLiteral("disk")));
        store.updateFileContent(id, QStringLiteral("local edit"));
        QVERIFY(store.state().fileById(id)->isDirty);

        OpenedFile incoming = makeFile(QStringLiteral("/a.ts"), QStringLiteral("other edit"));
        incoming.isDirty = true;
        store.openFile(incoming);
        QCOMPARE(store.state().fileById(id)->content, QStringLiteral("local edit"));

        // A clean version from disk does replace it
        store.openFile(makeFile(QStringLiteral("/a.ts"), QStringLiteral("fresh")));
        QCOMPARE(store.state().fileById(id)->content, QStringLiteral("fresh"));
        QVERIFY(!store.state().fileById(id)->isDirty);
    }

    void test_closeFile_activatesLastRemaining()
    {
        FileStore store(nullptr);
        const QString a = store.openFile(makeFile(QStringLiteral("/a")));
        const QString b = store.openFile(makeFile(QStringLiteral("/b")));
        const QString c = store.openFile(makeFile(QStringLiteral("/c")));
        store.setActiveFile(a);

        store.closeFile(a);
        QCOMPARE(store.activeFileId(), c);

        // Closing a non-active tab leaves the active one alone
        store.closeFile(b);
        QCOMPARE(store.activeFileId(), c);

        store.closeFile(c);
        QVERIFY(store.activeFileId().isEmpty());
        QCOMPARE(store.openedFileCount(), 0);
    }

    void test_closeFile_unknownId_noSignal()
    {
        FileStore store(nullptr);
        store.openFile(makeFile(QStringLiteral("/a")));
        QSignalSpy spy(&store, &FileStore::stateChanged);
        store.closeFile(QStringLiteral("missing"));
        QCOMPARE(spy.count(), 0);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Disk access
    // ═══════════════════════════════════════════════════════════════════════════

    void test_reload_isQueuedAndUpdatesContent()
    {
        FakeFileSystem fs;
        fs.files.insert(QStringLiteral("/p/foo.ts"), QStringLiteral("export {}"));
        FileStore store(&fs);
        const QString id = store.openFile(makeFile(QStringLiteral("/p/foo.ts"), QStringLiteral("")));

        QSignalSpy reloaded(&store, &FileStore::fileContentReloaded);
        store.reloadFileContent(id);
        QCOMPARE(fs.readCount, 0);

        QVERIFY(reloaded.wait(1000));
        QCOMPARE(reloaded.first().first().toString(), id);
        QCOMPARE(store.state().fileById(id)->content, QStringLiteral("export {}"));
    }

    void test_reload_skipsDirtyTab()
    {
        FakeFileSystem fs;
        fs.files.insert(QStringLiteral("/p/foo.ts"), QStringLiteral("disk"));
        FileStore store(&fs);
        const QString id = store.openFile(makeFile(QStringLiteral("/p/foo.ts"), QStringLiteral("disk")));
        store.updateFileContent(id, QStringLiteral("unsaved"));

        store.reloadFileContent(id);
        QCoreApplication::processEvents();

        QCOMPARE(fs.readCount, 0);
        QCOMPARE(store.state().fileById(id)->content, QStringLiteral("unsaved"));
    }

    void test_reload_missingFile_reportsFailure()
    {
        FakeFileSystem fs;
        FileStore store(&fs);
        const QString id = store.openFile(makeFile(QStringLiteral("/gone.md"), QStringLiteral("")));

        QSignalSpy failed(&store, &FileStore::fileContentReloadFailed);
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Failed to reload file")));
        store.reloadFileContent(id);

        QVERIFY(failed.wait(1000));
        QCOMPARE(failed.first().at(1).toString(), QStringLiteral("/gone.md"));
        QCOMPARE(store.openedFileCount(), 1);
    }

    void test_refreshFileTree_buildsRootNode()
    {
        FakeFileSystem fs;
        FileNode child;
        child.id = QStringLiteral("n1");
        child.name = QStringLiteral("README.md");
        child.path = QStringLiteral("/work/proj/README.md");
        fs.directories.insert(QStringLiteral("/work/proj"), {child});

        FileStore store(&fs);
        store.setRootPath(QStringLiteral("/work/proj"));

        QSignalSpy refreshed(&store, &FileStore::fileTreeRefreshed);
        store.refreshFileTree();
        QVERIFY(refreshed.wait(1000));

        QVERIFY(store.state().fileTree.has_value());
        QCOMPARE(store.state().fileTree->name, QStringLiteral("proj"));
        QVERIFY(store.state().fileTree->isDirectory);
        QCOMPARE(store.state().fileTree->children.size(), 1);
    }

    void test_setRootPath_empty_clearsTree()
    {
        FakeFileSystem fs;
        fs.directories.insert(QStringLiteral("/r"), {});
        FileStore store(&fs);
        store.setRootPath(QStringLiteral("/r"));
        QSignalSpy refreshed(&store, &FileStore::fileTreeRefreshed);
        store.refreshFileTree();
        QVERIFY(refreshed.wait(1000));
        QVERIFY(store.state().fileTree.has_value());

        store.setRootPath(QString());
        QVERIFY(!store.state().fileTree.has_value());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Replication
    // ═══════════════════════════════════════════════════════════════════════════

    void test_syncState_keepsLocalContentForKnownTabs()
    {
        FileStore store(nullptr);
        OpenedFile local = makeFile(QStringLiteral("/a.ts"), QStringLiteral("local"));
        local.id = QStringLiteral("f1");
        store.openFile(local);
        store.setFileDirty(QStringLiteral("f1"), true);

        // The other window still has the saved version
        OpenedFile remote = local;
        remote.content = QString();
        remote.isDirty = false;
        OpenedFile added = makeFile(QStringLiteral("/b.ts"));
        added.id = QStringLiteral("f2");

        FileSnapshot snapshot;
        snapshot.openedFiles = QVector<OpenedFile>{remote, added};
        snapshot.activeFileId = QStringLiteral("f2");
        store.syncState(snapshot);

        QCOMPARE(store.openedFileCount(), 2);
        QCOMPARE(store.state().fileById(QStringLiteral("f1"))->content, QStringLiteral("local"));
        QVERIFY(store.state().fileById(QStringLiteral("f1"))->isDirty);
        QVERIFY(store.state().fileById(QStringLiteral("f2"))->content.isEmpty());
        QCOMPARE(store.activeFileId(), QStringLiteral("f2"));
    }

    void test_syncState_absentFieldsUntouched()
    {
        FileStore store(nullptr);
        store.setRootPath(QStringLiteral("/root"));
        store.openFile(makeFile(QStringLiteral("/root/x")));

        FileSnapshot snapshot;
        snapshot.activeFileId = QString();
        store.syncState(snapshot);

        QCOMPARE(store.rootPath(), QStringLiteral("/root"));
        QCOMPARE(store.openedFileCount(), 1);
        QVERIFY(store.activeFileId().isEmpty());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // FileActions
    // ═══════════════════════════════════════════════════════════════════════════

    void test_fileActions_openIntoActivePane()
    {
        FakeFileSystem fs;
        fs.files.insert(QStringLiteral("/tmp/readme.md"), QStringLiteral("# Hello"));
        FileStore fileStore(&fs);
        LayoutStore layoutStore;
        FileActions actions(&fileStore, &layoutStore, &fs);

        const FileOpenResult result = actions.openFileFromPath(QStringLiteral("/tmp/readme.md"), 12);

        QVERIFY(result.success);
        const OpenedFile* file = fileStore.state().fileById(result.fileId);
        QVERIFY(file);
        QCOMPARE(file->name, QStringLiteral("readme.md"));
        QCOMPARE(file->language, QStringLiteral("markdown"));
        QCOMPARE(file->content, QStringLiteral("# Hello"));
        QCOMPARE(file->initialLine.value_or(-1), 12);
        QCOMPARE(layoutStore.state().paneById(layoutStore.activePaneId())->fileId, result.fileId);
    }

    void test_fileActions_unreadableFile_fails()
    {
        FakeFileSystem fs;
        FileStore fileStore(&fs);
        LayoutStore layoutStore;
        FileActions actions(&fileStore, &layoutStore, &fs);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("cannot read")));
        const FileOpenResult result = actions.openFileFromPath(QStringLiteral("/nope.txt"));

        QVERIFY(!result.success);
        QVERIFY(!result.errorMessage.isEmpty());
        QCOMPARE(fileStore.openedFileCount(), 0);
    }
};

QTEST_MAIN(TestFileStore)
#include "test_file_store.moc"

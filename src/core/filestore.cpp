// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "filestore.h"
#include "interfaces.h"
#include "logging.h"
#include <QFileInfo>
#include <QMetaObject>
#include <QUuid>

namespace PaneSync {

FileStore::FileStore(IFileSystem* fileSystem, QObject* parent)
    : QObject(parent)
    , m_fileSystem(fileSystem)
{
}

OpenedFile* FileStore::mutableFileById(const QString& id)
{
    if (id.isEmpty()) {
        return nullptr;
    }
    for (OpenedFile& file : m_state.openedFiles) {
        if (file.id == id) {
            return &file;
        }
    }
    return nullptr;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Tabs
// ═══════════════════════════════════════════════════════════════════════════════

QString FileStore::openFile(const OpenedFile& file)
{
    const FileState previous = m_state;

    QString idToActivate = file.id;
    bool found = false;
    if (!file.path.isEmpty()) {
        for (OpenedFile& existing : m_state.openedFiles) {
            if (existing.path != file.path) {
                continue;
            }
            found = true;
            idToActivate = existing.id;
            existing.initialLine = file.initialLine;
            const bool shouldUpdateContent = !file.content.isNull() && (!existing.isDirty || !file.isDirty);
            if (shouldUpdateContent) {
                existing.content = file.content;
                existing.isDirty = file.isDirty;
            }
            break;
        }
    }

    if (!found) {
        OpenedFile added = file;
        if (added.id.isEmpty()) {
            added.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        }
        if (added.name.isEmpty() && !added.path.isEmpty()) {
            added.name = QFileInfo(added.path).fileName();
        }
        idToActivate = added.id;
        m_state.openedFiles.append(added);
        qCDebug(lcStore) << "Opened" << added.path << "as" << added.id;
    }

    m_state.activeFileId = idToActivate;
    commit(previous);
    return idToActivate;
}

void FileStore::closeFile(const QString& id)
{
    const FileState previous = m_state;

    const auto removed = m_state.openedFiles.removeIf([&id](const OpenedFile& f) {
        return f.id == id;
    });
    if (removed == 0) {
        qCDebug(lcStore) << "closeFile: no tab with id" << id;
        return;
    }

    if (m_state.activeFileId == id) {
        m_state.activeFileId = m_state.openedFiles.isEmpty() ? QString() : m_state.openedFiles.constLast().id;
    }
    commit(previous);
}

void FileStore::setActiveFile(const QString& id)
{
    const FileState previous = m_state;
    m_state.activeFileId = id;
    commit(previous);
}

void FileStore::updateFileContent(const QString& id, const QString& content)
{
    const FileState previous = m_state;
    if (OpenedFile* file = mutableFileById(id)) {
        file->content = content;
        file->isDirty = true;
    }
    commit(previous);
}

void FileStore::setFileDirty(const QString& id, bool isDirty)
{
    const FileState previous = m_state;
    if (OpenedFile* file = mutableFileById(id)) {
        file->isDirty = isDirty;
    }
    commit(previous);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Project
// ═══════════════════════════════════════════════════════════════════════════════

void FileStore::setRootPath(const QString& path)
{
    const FileState previous = m_state;
    m_state.rootPath = path;
    if (path.isEmpty()) {
        m_state.fileTree.reset();
    }
    qCInfo(lcStore) << "Project root set to" << (path.isEmpty() ? QStringLiteral("<none>") : path);
    commit(previous);
}

void FileStore::reloadFileContent(const QString& id)
{
    QMetaObject::invokeMethod(
        this,
        [this, id]() {
            doReloadFileContent(id);
        },
        Qt::QueuedConnection);
}

void FileStore::doReloadFileContent(const QString& id)
{
    const OpenedFile* file = m_state.fileById(id);
    if (!file) {
        qCDebug(lcStore) << "Reload skipped, tab closed meanwhile:" << id;
        return;
    }
    if (file->path.isEmpty() || file->isDirty) {
        qCDebug(lcStore) << "Reload skipped for" << id << "- no path or unsaved changes";
        return;
    }
    if (!m_fileSystem) {
        qCWarning(lcStore) << "Cannot reload" << file->path << "- no file system";
        Q_EMIT fileContentReloadFailed(id, file->path);
        return;
    }

    const QString path = file->path;
    const std::optional<QString> content = m_fileSystem->readFile(path);
    if (!content) {
        qCWarning(lcStore) << "Failed to reload file" << path;
        Q_EMIT fileContentReloadFailed(id, path);
        return;
    }

    const FileState previous = m_state;
    if (OpenedFile* target = mutableFileById(id)) {
        target->content = *content;
        target->isDirty = false;
    }
    commit(previous);
    Q_EMIT fileContentReloaded(id);
}

void FileStore::refreshFileTree()
{
    QMetaObject::invokeMethod(
        this,
        [this]() {
            doRefreshFileTree();
        },
        Qt::QueuedConnection);
}

void FileStore::doRefreshFileTree()
{
    const QString rootPath = m_state.rootPath;
    if (rootPath.isEmpty()) {
        return;
    }
    if (!m_fileSystem) {
        qCWarning(lcStore) << "Cannot refresh file tree - no file system";
        Q_EMIT fileTreeRefreshFailed(rootPath);
        return;
    }

    const auto children = m_fileSystem->readDirectory(rootPath);
    if (!children) {
        qCWarning(lcStore) << "Failed to refresh file tree for" << rootPath;
        Q_EMIT fileTreeRefreshFailed(rootPath);
        return;
    }

    FileNode root;
    root.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    root.name = QFileInfo(rootPath).fileName();
    if (root.name.isEmpty()) {
        root.name = QStringLiteral("Project");
    }
    root.path = rootPath;
    root.isDirectory = true;
    root.children = *children;

    const FileState previous = m_state;
    m_state.fileTree = root;
    commit(previous);
    qCDebug(lcStore) << "File tree refreshed:" << children->size() << "entries under" << rootPath;
    Q_EMIT fileTreeRefreshed();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Replication
// ═══════════════════════════════════════════════════════════════════════════════

void FileStore::syncState(const FileSnapshot& snapshot)
{
    const FileState previous = m_state;

    if (snapshot.openedFiles) {
        QVector<OpenedFile> merged = *snapshot.openedFiles;
        for (OpenedFile& incoming : merged) {
            const OpenedFile* local = previous.fileById(incoming.id);
            if (local && local->path == incoming.path && incoming.content.isEmpty()) {
                // Unsaved edits stay local, together with their dirty marker
                incoming.content = local->content;
                incoming.isDirty = local->isDirty;
            }
        }
        m_state.openedFiles = merged;
    }
    if (snapshot.activeFileId) {
        m_state.activeFileId = *snapshot.activeFileId;
    }
    if (snapshot.rootPath) {
        m_state.rootPath = *snapshot.rootPath;
    }

    commit(previous);
}

void FileStore::commit(const FileState& previous)
{
    if (m_state == previous) {
        return;
    }

    Q_EMIT stateChanged(previous, m_state);

    if (m_state.activeFileId != previous.activeFileId) {
        Q_EMIT activeFileIdChanged();
    }
    if (m_state.rootPath != previous.rootPath) {
        Q_EMIT rootPathChanged();
    }
    if (m_state.openedFiles != previous.openedFiles) {
        Q_EMIT openedFilesChanged();
    }
}

} // namespace PaneSync

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "fileactions.h"
#include "filestore.h"
#include "interfaces.h"
#include "languagedetection.h"
#include "layoutstore.h"
#include "logging.h"
#include <KLocalizedString>
#include <QFileInfo>
#include <QUuid>

namespace PaneSync {

FileActions::FileActions(FileStore* fileStore, LayoutStore* layoutStore, IFileSystem* fileSystem)
    : m_fileStore(fileStore)
    , m_layoutStore(layoutStore)
    , m_fileSystem(fileSystem)
{
}

FileOpenResult FileActions::openFileFromPath(const QString& path, std::optional<int> initialLine)
{
    FileOpenResult result;

    if (path.isEmpty()) {
        result.errorMessage = i18n("No file path given");
        return result;
    }
    if (!m_fileStore || !m_fileSystem) {
        qCWarning(lcStore) << "openFileFromPath: file store or file system unavailable";
        result.errorMessage = i18n("File access is not available");
        return result;
    }

    const std::optional<QString> content = m_fileSystem->readFile(path);
    if (!content) {
        qCWarning(lcStore) << "openFileFromPath: cannot read" << path;
        result.errorMessage = i18n("Could not read %1", path);
        return result;
    }

    OpenedFile file;
    file.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    file.path = path;
    file.name = QFileInfo(path).fileName();
    file.content = *content;
    file.isDirty = false;
    file.language = LanguageDetection::detectLanguageFromPath(path);
    file.initialLine = initialLine;

    result.fileId = m_fileStore->openFile(file);
    result.success = true;

    if (m_layoutStore) {
        const QString paneId = m_layoutStore->activePaneId();
        if (!paneId.isEmpty()) {
            m_layoutStore->assignFileToPane(paneId, result.fileId);
        }
    }

    qCInfo(lcStore) << "Opened" << path << "as" << file.language << "in tab" << result.fileId;
    return result;
}

void FileActions::refreshFileTree()
{
    if (m_fileStore) {
        m_fileStore->refreshFileTree();
    }
}

} // namespace PaneSync

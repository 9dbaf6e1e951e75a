// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "localfilesystem.h"
#include "logging.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QUuid>

namespace PaneSync {

std::optional<QString> LocalFileSystem::readFile(const QString& path) const
{
    if (path.isEmpty()) {
        qCWarning(lcCore) << "readFile called with empty path";
        return std::nullopt;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcCore) << "Cannot open" << path << "-" << file.errorString();
        return std::nullopt;
    }

    return QString::fromUtf8(file.readAll());
}

std::optional<QVector<FileNode>> LocalFileSystem::readDirectory(const QString& path) const
{
    QDir dir(path);
    if (path.isEmpty() || !dir.exists()) {
        qCWarning(lcCore) << "Cannot read directory" << path;
        return std::nullopt;
    }

    const QFileInfoList entries =
        dir.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden, QDir::DirsFirst | QDir::Name);

    QVector<FileNode> nodes;
    nodes.reserve(entries.size());
    for (const QFileInfo& info : entries) {
        // Skip VCS metadata and hidden directories, keep hidden files
        if (info.isHidden() && info.isDir()) {
            continue;
        }

        FileNode node;
        node.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        node.name = info.fileName();
        node.path = info.absoluteFilePath();
        node.isDirectory = info.isDir();
        nodes.append(node);
    }

    return nodes;
}

} // namespace PaneSync

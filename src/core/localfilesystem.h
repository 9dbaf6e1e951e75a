// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "interfaces.h"

namespace PaneSync {

/**
 * @brief IFileSystem backed by QFile / QDir
 *
 * Hidden entries are skipped except for dotfiles that editors commonly
 * open (.gitignore, .env, ...); directory listings are one level deep.
 */
class PANESYNC_EXPORT LocalFileSystem : public IFileSystem
{
public:
    LocalFileSystem() = default;
    ~LocalFileSystem() override = default;

    std::optional<QString> readFile(const QString& path) const override;
    std::optional<QVector<FileNode>> readDirectory(const QString& path) const override;
};

} // namespace PaneSync

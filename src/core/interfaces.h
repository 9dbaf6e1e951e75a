// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include "types.h"
#include <QObject>
#include <QPointF>
#include <QString>
#include <QVector>
#include <optional>

namespace PaneSync {

/**
 * @brief Abstract access to the on-disk project
 *
 * Stores and file actions depend on this interface rather than on QFile
 * directly, so tests can substitute an in-memory file system.
 */
class PANESYNC_EXPORT IFileSystem
{
public:
    virtual ~IFileSystem();

    /**
     * @brief Read a whole text file
     * @param path Absolute path
     * @return File content, or std::nullopt if the file cannot be read
     */
    virtual std::optional<QString> readFile(const QString& path) const = 0;

    /**
     * @brief List the entries of a directory (one level, directories first)
     * @param path Absolute directory path
     * @return Child nodes, or std::nullopt if the directory cannot be read
     */
    virtual std::optional<QVector<FileNode>> readDirectory(const QString& path) const = 0;
};

/**
 * @brief Abstract toast / notification surface
 *
 * Only user-invoked failures (opening a dropped file) are surfaced here;
 * background sync failures are logged instead.
 */
class PANESYNC_EXPORT INotifier : public QObject
{
    Q_OBJECT

public:
    explicit INotifier(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~INotifier() override;

    virtual void showError(const QString& title, const QString& message) = 0;

Q_SIGNALS:
    /**
     * @brief Emitted for every toast so the host window can render it
     */
    void toastRequested(const QString& title, const QString& message);
};

/**
 * @brief Answers whether a window-local point lies inside the chat region
 *
 * Implementations walk from the deepest item under the point up to the
 * designated chat-region marker.
 */
class PANESYNC_EXPORT IRegionHitTester
{
public:
    virtual ~IRegionHitTester();

    virtual bool isInChatRegion(const QPointF& point) const = 0;
};

} // namespace PaneSync

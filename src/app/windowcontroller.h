// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../sync/eventtransport.h"
#include <QObject>
#include <QPointer>
#include <QString>
#include <memory>

class QQuickWindow;

namespace PaneSync {

class ChatAttachments;
class CursorPositionCell;
class DragOverChatFlag;
class DragRegionArbiter;
class EventTransport;
class FileActions;
class FileDropRouter;
class FileStore;
class LayoutStore;
class LocalFileSystem;
class NativeDropSource;
class QuickRegionHitTester;
class Settings;
class SyncSession;
class ToastService;

/**
 * @brief Options given on the command line for one window process
 */
struct WindowOptions {
    QString windowLabel; ///< Empty: generate one
    QString projectPath; ///< Empty: start without a project
    bool syncEnabled = true;
};

/**
 * @brief Composition root of one window process
 *
 * Owns the stores, the sync session and the drag/drop pipeline, and
 * connects them to the QML host window once it exists.
 *
 * Lifecycle: construct, attachWindow(), start(). Destruction tears the
 * sync session down before anything else goes away.
 */
class WindowController : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QString windowLabel READ windowLabel CONSTANT)
    Q_PROPERTY(bool syncActive READ isSyncActive NOTIFY syncActiveChanged)

public:
    WindowController(Settings* settings, const WindowOptions& options, QObject* parent = nullptr);
    ~WindowController() override;

    /**
     * @brief Identity used when none is given: "window-" plus 8 hex digits
     */
    static QString generateWindowLabel();

    QString windowLabel() const { return m_windowLabel; }
    bool isSyncActive() const;

    FileStore* fileStore() const { return m_fileStore; }
    LayoutStore* layoutStore() const { return m_layoutStore; }
    FileActions* fileActions() const { return m_fileActions.get(); }
    ToastService* toastService() const { return m_toastService; }
    DragOverChatFlag* dragOverChat() const { return m_dragOverChat; }
    DragRegionArbiter* dragArbiter() const { return m_arbiter; }
    ChatAttachments* chatAttachments() const { return m_chatAttachments; }

    /**
     * @brief Hook the drag/drop pipeline into the host window
     */
    void attachWindow(QQuickWindow* window);

    /**
     * @brief Join the other windows and open the project from the command line
     */
    void start();

    Q_INVOKABLE void openProject(const QString& path);
    Q_INVOKABLE bool openFile(const QString& path);
    Q_INVOKABLE void splitActivePane(bool vertical);
    Q_INVOKABLE void closeActivePane();

Q_SIGNALS:
    void syncActiveChanged();

private:
    void applySettings();

    QPointer<Settings> m_settings;
    WindowOptions m_options;
    QString m_windowLabel;

    std::unique_ptr<LocalFileSystem> m_fileSystem;
    FileStore* m_fileStore = nullptr;
    LayoutStore* m_layoutStore = nullptr;
    std::unique_ptr<FileActions> m_fileActions;
    ToastService* m_toastService = nullptr;

    EventTransport* m_transport = nullptr;
    SyncSession* m_syncSession = nullptr;
    Teardown m_syncTeardown;

    CursorPositionCell* m_cursor = nullptr;
    DragOverChatFlag* m_dragOverChat = nullptr;
    std::unique_ptr<QuickRegionHitTester> m_hitTester;
    DragRegionArbiter* m_arbiter = nullptr;
    NativeDropSource* m_dropSource = nullptr;
    FileDropRouter* m_dropRouter = nullptr;
    ChatAttachments* m_chatAttachments = nullptr;
};

} // namespace PaneSync

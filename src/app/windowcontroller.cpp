// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowcontroller.h"
#include "../config/settings.h"
#include "../core/constants.h"
#include "../core/fileactions.h"
#include "../core/filestore.h"
#include "../core/layoutstore.h"
#include "../core/localfilesystem.h"
#include "../core/logging.h"
#include "../core/toastservice.h"
#include "../dbus/dbuseventtransport.h"
#include "../drag/chatattachments.h"
#include "../drag/dragregionarbiter.h"
#include "../drag/dragstate.h"
#include "../drag/filedroprouter.h"
#include "../drag/nativedropsource.h"
#include "../drag/quickregionhittester.h"
#include "../sync/syncsession.h"
#include <KLocalizedString>
#include <QQuickItem>
#include <QQuickWindow>
#include <QUuid>

namespace PaneSync {

WindowController::WindowController(Settings* settings, const WindowOptions& options, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_options(options)
    , m_windowLabel(options.windowLabel.isEmpty() ? generateWindowLabel() : options.windowLabel)
    , m_fileSystem(std::make_unique<LocalFileSystem>())
{
    // ═══════════════════════════════════════════════════════════════════════════
    // Stores
    // ═══════════════════════════════════════════════════════════════════════════

    m_fileStore = new FileStore(m_fileSystem.get(), this);
    m_layoutStore = new LayoutStore(this);
    m_fileActions = std::make_unique<FileActions>(m_fileStore, m_layoutStore, m_fileSystem.get());
    m_toastService = new ToastService(this);

    // Panes must not keep showing tabs that were closed
    connect(m_fileStore, &FileStore::openedFilesChanged, this, [this]() {
        m_layoutStore->validateLayout(m_fileStore->state().openedFileIds());
    });

    // ═══════════════════════════════════════════════════════════════════════════
    // Cross-window sync
    // ═══════════════════════════════════════════════════════════════════════════

    if (m_settings && !m_settings->syncEnabled()) {
        m_options.syncEnabled = false;
    }
    if (m_options.syncEnabled) {
        m_transport = new DBusEventTransport(m_windowLabel, QDBusConnection::sessionBus(), this);
    }
    m_syncSession = new SyncSession(m_transport, m_fileStore, m_layoutStore, this);

    // ═══════════════════════════════════════════════════════════════════════════
    // Drag and drop
    // ═══════════════════════════════════════════════════════════════════════════

    m_cursor = new CursorPositionCell(this);
    m_dragOverChat = new DragOverChatFlag(this);
    m_hitTester = std::make_unique<QuickRegionHitTester>(nullptr, QString());
    m_arbiter = new DragRegionArbiter(m_hitTester.get(), m_cursor, m_dragOverChat, this);
    m_dropSource = new NativeDropSource(this);
    m_chatAttachments = new ChatAttachments(m_dragOverChat, m_arbiter, this);
    m_dropRouter = new FileDropRouter(m_dragOverChat, m_arbiter, m_fileActions.get(), m_toastService, this);

    connect(m_dropSource, &NativeDropSource::filesDropped, m_chatAttachments, &ChatAttachments::onFilesDropped);
    connect(m_dropSource, &NativeDropSource::filesDropped, m_dropRouter, &FileDropRouter::onFilesDropped);

    if (m_settings) {
        connect(m_settings, &Settings::settingsChanged, this, &WindowController::applySettings);
    }
    applySettings();

    qCInfo(lcApp) << "Window" << m_windowLabel << "created";
}

WindowController::~WindowController()
{
    if (m_syncTeardown) {
        m_syncTeardown();
    }
    // The arbiter holds the hit tester by raw pointer
    m_arbiter->uninstall();
    m_dropSource->uninstall();
}

QString WindowController::generateWindowLabel()
{
    return QStringLiteral("window-") + QUuid::createUuid().toString(QUuid::Id128).left(8);
}

bool WindowController::isSyncActive() const
{
    return m_syncSession && m_syncSession->isActive();
}

void WindowController::applySettings()
{
    if (!m_settings) {
        m_hitTester->setMarkerName(Defaults::ChatRegionMarker);
        return;
    }
    m_syncSession->setHandshakeGraceMs(m_settings->handshakeGraceMs());
    m_arbiter->setPollIntervalMs(m_settings->pollIntervalMs());
    m_hitTester->setMarkerName(m_settings->chatRegionMarker());
    m_toastService->setUsePlasmaOsd(m_settings->usePlasmaOsd());
}

void WindowController::attachWindow(QQuickWindow* window)
{
    if (!window) {
        qCWarning(lcApp) << "No host window, drag and drop disabled";
        return;
    }
    m_hitTester->setRoot(window->contentItem());
    m_arbiter->install(window);
    m_dropSource->install(window);

    if (!m_hitTester->markerItem()) {
        qCWarning(lcApp) << "Host window has no item named" << m_hitTester->markerName()
                         << "- drops will always open in the editor";
    }
}

void WindowController::start()
{
    if (m_options.syncEnabled) {
        m_syncTeardown = m_syncSession->initialize();
        Q_EMIT syncActiveChanged();
    } else {
        qCInfo(lcApp) << "Cross-window sync disabled for" << m_windowLabel;
    }

    if (!m_options.projectPath.isEmpty()) {
        openProject(m_options.projectPath);
    }
}

void WindowController::openProject(const QString& path)
{
    m_fileStore->setRootPath(path);
    m_fileActions->refreshFileTree();
}

bool WindowController::openFile(const QString& path)
{
    const FileOpenResult result = m_fileActions->openFileFromPath(path);
    if (!result.success) {
        m_toastService->showError(i18n("Cannot open file"), result.errorMessage);
    }
    return result.success;
}

void WindowController::splitActivePane(bool vertical)
{
    m_layoutStore->splitPane(vertical ? SplitDirection::Vertical : SplitDirection::Horizontal);
}

void WindowController::closeActivePane()
{
    m_layoutStore->closePane(m_layoutStore->activePaneId());
}

} // namespace PaneSync

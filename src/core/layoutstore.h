// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include "types.h"
#include <QObject>
#include <QString>
#include <QStringList>

namespace PaneSync {

/**
 * @brief Owns the pane split layout and panel visibility of one window
 *
 * Pane invariant, re-established after every operation that touches panes:
 * - at least one and at most LayoutConstants::MaxPanes panes exist
 * - pane sizes sum to 100 (within rounding)
 * - no resize leaves a pane below LayoutConstants::MinPaneSize
 *
 * Every mutation publishes stateChanged(previous, next). Operations that
 * cannot be applied log a warning and leave the state untouched.
 */
class PANESYNC_EXPORT LayoutStore : public QObject
{
    Q_OBJECT

    Q_PROPERTY(bool chatOpen READ isChatOpen WRITE setChatOpen NOTIFY chatOpenChanged)
    Q_PROPERTY(bool terminalOpen READ isTerminalOpen WRITE setTerminalOpen NOTIFY terminalOpenChanged)
    Q_PROPERTY(int paneCount READ paneCount NOTIFY panesChanged)
    Q_PROPERTY(QString activePaneId READ activePaneId WRITE setActivePane NOTIFY activePaneIdChanged)
    Q_PROPERTY(int chatWidth READ chatWidth WRITE setChatWidth NOTIFY panelGeometryChanged)
    Q_PROPERTY(int sidebarWidth READ sidebarWidth WRITE setSidebarWidth NOTIFY panelGeometryChanged)

public:
    explicit LayoutStore(QObject* parent = nullptr);
    ~LayoutStore() override = default;

    LayoutStore(const LayoutStore&) = delete;
    LayoutStore& operator=(const LayoutStore&) = delete;

    /**
     * @brief The layout every window starts from: one full-size pane
     */
    static LayoutState defaultState();

    const LayoutState& state() const
    {
        return m_state;
    }
    bool isChatOpen() const
    {
        return m_state.isChatOpen;
    }
    bool isTerminalOpen() const
    {
        return m_state.isTerminalOpen;
    }
    int paneCount() const
    {
        return m_state.panes.size();
    }
    QString activePaneId() const
    {
        return m_state.activePaneId;
    }
    int chatWidth() const
    {
        return m_state.chatWidth;
    }
    int sidebarWidth() const
    {
        return m_state.sidebarWidth;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Pane operations
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Split a pane in two
     * @param direction Split direction recorded for the whole layout
     * @param targetPaneId Pane to split; empty means the active pane
     * @return Id of the new pane, or empty if the split was refused
     *
     * The target is halved and the new pane takes the other half. The new
     * pane is appended to the list and becomes active.
     */
    QString splitPane(SplitDirection direction, const QString& targetPaneId = QString());

    /**
     * @brief Close a pane and share its space equally among the rest
     * @return false if the pane is unknown or is the last one
     */
    Q_INVOKABLE bool closePane(const QString& paneId);

    /**
     * @brief Resize a pane, taking the difference from the following panes
     *
     * The requested size is clamped so that every pane stays at or above the
     * minimum. The next pane in list order absorbs the delta down to the
     * minimum, any remainder comes from the panes after it.
     */
    Q_INVOKABLE void resizePane(const QString& paneId, qreal size);

    Q_INVOKABLE void setActivePane(const QString& paneId);

    /**
     * @brief Show a file in a pane and make that pane active
     */
    Q_INVOKABLE void assignFileToPane(const QString& paneId, const QString& fileId);

    Q_INVOKABLE void resetLayout();

    /**
     * @brief Clear pane file references that are not in @p openFileIds
     */
    void validateLayout(const QStringList& openFileIds);

    // ═══════════════════════════════════════════════════════════════════════
    // Panels
    // ═══════════════════════════════════════════════════════════════════════

    void setChatOpen(bool open);
    Q_INVOKABLE void toggleChat();
    void setTerminalOpen(bool open);
    Q_INVOKABLE void toggleTerminal();
    void setCommandPaletteOpen(bool open);
    Q_INVOKABLE void toggleCommandPalette();
    void setSettingsOpen(bool open);
    Q_INVOKABLE void toggleSettings();
    void setSidebarOpen(bool open);
    Q_INVOKABLE void toggleSidebar();
    void setChatWidth(int width);
    void setSidebarWidth(int width);

    // ═══════════════════════════════════════════════════════════════════════
    // Replication
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Merge a snapshot received from another window
     *
     * Fields absent from the snapshot are left alone. An incoming pane list
     * that breaks the pane invariant is repaired before it is stored.
     */
    void syncState(const LayoutSnapshot& snapshot);

    /**
     * @brief Repair a pane list so it satisfies the pane invariant
     * @return true if @p panes was modified
     */
    static bool normalizePanes(QVector<Pane>& panes);

Q_SIGNALS:
    void stateChanged(const PaneSync::LayoutState& previous, const PaneSync::LayoutState& next);
    void panesChanged();
    void activePaneIdChanged();
    void chatOpenChanged();
    void terminalOpenChanged();
    void panelGeometryChanged();

private:
    void commit(const LayoutState& previous);
    static QString generatePaneId();

    LayoutState m_state;
};

} // namespace PaneSync

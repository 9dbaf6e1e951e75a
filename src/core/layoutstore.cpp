// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layoutstore.h"
#include "constants.h"
#include "logging.h"
#include <QSet>
#include <QUuid>
#include <QtMath>
#include <cmath>

namespace PaneSync {

namespace {

qreal roundToTenth(qreal value)
{
    return std::round(value * 10.0) / 10.0;
}

qreal sumSizes(const QVector<Pane>& panes)
{
    qreal total = 0.0;
    for (const Pane& pane : panes) {
        total += pane.size;
    }
    return total;
}

// Scale sizes so they sum to 100, then round each to one decimal
void scaleToTotal(QVector<Pane>& panes)
{
    const qreal total = sumSizes(panes);
    if (total <= 0.0) {
        const qreal equal = LayoutConstants::TotalSize / panes.size();
        for (Pane& pane : panes) {
            pane.size = equal;
        }
        return;
    }
    if (qFuzzyCompare(total, LayoutConstants::TotalSize)) {
        return;
    }
    const qreal scale = LayoutConstants::TotalSize / total;
    for (Pane& pane : panes) {
        pane.size = roundToTenth(pane.size * scale);
    }
}

} // namespace

LayoutStore::LayoutStore(QObject* parent)
    : QObject(parent)
    , m_state(defaultState())
{
}

LayoutState LayoutStore::defaultState()
{
    LayoutState state;
    state.chatWidth = Defaults::ChatWidth;
    state.sidebarWidth = Defaults::SidebarWidth;

    Pane pane;
    pane.id = Defaults::DefaultPaneId;
    pane.size = LayoutConstants::TotalSize;
    state.panes.append(pane);
    state.activePaneId = pane.id;
    state.splitDirection = SplitDirection::Horizontal;
    return state;
}

QString LayoutStore::generatePaneId()
{
    return QStringLiteral("pane-") + QUuid::createUuid().toString(QUuid::Id128).left(8);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Pane operations
// ═══════════════════════════════════════════════════════════════════════════════

QString LayoutStore::splitPane(SplitDirection direction, const QString& targetPaneId)
{
    const QString targetId = targetPaneId.isEmpty() ? m_state.activePaneId : targetPaneId;
    if (targetId.isEmpty()) {
        qCWarning(lcLayout) << "splitPane: no target pane and no active pane";
        return QString();
    }
    if (m_state.panes.size() >= LayoutConstants::MaxPanes) {
        qCWarning(lcLayout) << "splitPane: maximum of" << LayoutConstants::MaxPanes << "panes reached";
        return QString();
    }

    const int index = m_state.paneIndex(targetId);
    if (index < 0) {
        qCWarning(lcLayout) << "splitPane: unknown pane" << targetId;
        return QString();
    }

    const LayoutState previous = m_state;

    Pane& target = m_state.panes[index];
    const qreal half = target.size / 2.0;
    target.size = half;

    Pane added;
    added.id = generatePaneId();
    added.size = half;
    added.position = target.position;

    m_state.panes.append(added);
    m_state.activePaneId = added.id;
    m_state.splitDirection = direction;

    qCDebug(lcLayout) << "Split" << targetId << "into" << added.id << "- panes:" << m_state.panes.size();
    commit(previous);
    return added.id;
}

bool LayoutStore::closePane(const QString& paneId)
{
    if (m_state.panes.size() <= 1) {
        qCWarning(lcLayout) << "closePane: at least one pane must remain, ignoring close of" << paneId;
        return false;
    }

    const int index = m_state.paneIndex(paneId);
    if (index < 0) {
        qCWarning(lcLayout) << "closePane: unknown pane" << paneId;
        return false;
    }

    const LayoutState previous = m_state;

    m_state.panes.removeAt(index);
    const qreal equal = LayoutConstants::TotalSize / m_state.panes.size();
    for (Pane& pane : m_state.panes) {
        pane.size = equal;
    }
    m_state.activePaneId = m_state.panes.constFirst().id;

    commit(previous);
    return true;
}

void LayoutStore::resizePane(const QString& paneId, qreal size)
{
    const int index = m_state.paneIndex(paneId);
    if (index < 0) {
        qCWarning(lcLayout) << "resizePane: unknown pane" << paneId;
        return;
    }

    const int count = m_state.panes.size();
    if (count < 2) {
        // A lone pane always fills the editor area
        return;
    }

    const LayoutState previous = m_state;
    QVector<Pane>& panes = m_state.panes;

    const qreal maxSize = qMin(LayoutConstants::TotalSize - LayoutConstants::MinPaneSize,
                               LayoutConstants::TotalSize - LayoutConstants::MinPaneSize * (count - 1));
    const qreal clamped = qBound(LayoutConstants::MinPaneSize, size, maxSize);
    qreal delta = clamped - panes[index].size;
    panes[index].size = clamped;

    if (delta < 0.0) {
        // Shrinking: the next pane takes the freed space
        Pane& next = panes[(index + 1) % count];
        next.size -= delta;
    } else {
        // Growing: take from the next pane down to the minimum, then from the ones after it
        for (int step = 1; step < count && delta > 0.0; ++step) {
            Pane& other = panes[(index + step) % count];
            const qreal available = qMax(0.0, other.size - LayoutConstants::MinPaneSize);
            const qreal taken = qMin(available, delta);
            other.size -= taken;
            delta -= taken;
        }
    }

    scaleToTotal(panes);
    for (Pane& pane : panes) {
        pane.size = roundToTenth(pane.size);
    }

    commit(previous);
}

void LayoutStore::setActivePane(const QString& paneId)
{
    const LayoutState previous = m_state;
    m_state.activePaneId = paneId;
    commit(previous);
}

void LayoutStore::assignFileToPane(const QString& paneId, const QString& fileId)
{
    const int index = m_state.paneIndex(paneId);
    if (index < 0) {
        qCWarning(lcLayout) << "assignFileToPane: unknown pane" << paneId;
        return;
    }

    const LayoutState previous = m_state;
    m_state.panes[index].fileId = fileId;
    m_state.activePaneId = paneId;
    commit(previous);
}

void LayoutStore::resetLayout()
{
    const LayoutState previous = m_state;
    const LayoutState initial = defaultState();
    m_state.panes = initial.panes;
    m_state.activePaneId = initial.activePaneId;
    m_state.splitDirection = initial.splitDirection;
    commit(previous);
}

void LayoutStore::validateLayout(const QStringList& openFileIds)
{
    const QSet<QString> valid(openFileIds.cbegin(), openFileIds.cend());

    const LayoutState previous = m_state;
    for (Pane& pane : m_state.panes) {
        if (!pane.fileId.isEmpty() && !valid.contains(pane.fileId)) {
            qCDebug(lcLayout) << "Pane" << pane.id << "referenced closed file" << pane.fileId;
            pane.fileId.clear();
        }
    }
    commit(previous);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Panels
// ═══════════════════════════════════════════════════════════════════════════════

void LayoutStore::setChatOpen(bool open)
{
    const LayoutState previous = m_state;
    m_state.isChatOpen = open;
    commit(previous);
}

void LayoutStore::toggleChat()
{
    setChatOpen(!m_state.isChatOpen);
}

void LayoutStore::setTerminalOpen(bool open)
{
    const LayoutState previous = m_state;
    m_state.isTerminalOpen = open;
    commit(previous);
}

void LayoutStore::toggleTerminal()
{
    setTerminalOpen(!m_state.isTerminalOpen);
}

void LayoutStore::setCommandPaletteOpen(bool open)
{
    const LayoutState previous = m_state;
    m_state.isCommandPaletteOpen = open;
    commit(previous);
}

void LayoutStore::toggleCommandPalette()
{
    setCommandPaletteOpen(!m_state.isCommandPaletteOpen);
}

void LayoutStore::setSettingsOpen(bool open)
{
    const LayoutState previous = m_state;
    m_state.isSettingsOpen = open;
    commit(previous);
}

void LayoutStore::toggleSettings()
{
    setSettingsOpen(!m_state.isSettingsOpen);
}

void LayoutStore::setSidebarOpen(bool open)
{
    const LayoutState previous = m_state;
    m_state.isSidebarOpen = open;
    commit(previous);
}

void LayoutStore::toggleSidebar()
{
    setSidebarOpen(!m_state.isSidebarOpen);
}

void LayoutStore::setChatWidth(int width)
{
    const LayoutState previous = m_state;
    m_state.chatWidth = qMax(0, width);
    commit(previous);
}

void LayoutStore::setSidebarWidth(int width)
{
    const LayoutState previous = m_state;
    m_state.sidebarWidth = qBound(LayoutConstants::MinSidebarWidth, width, LayoutConstants::MaxSidebarWidth);
    commit(previous);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Replication
// ═══════════════════════════════════════════════════════════════════════════════

bool LayoutStore::normalizePanes(QVector<Pane>& panes)
{
    const QVector<Pane> before = panes;

    // Drop anonymous and duplicate panes; every pane operation addresses panes by id
    QSet<QString> seen;
    panes.removeIf([&seen](const Pane& pane) {
        if (pane.id.isEmpty() || seen.contains(pane.id)) {
            return true;
        }
        seen.insert(pane.id);
        return false;
    });

    if (panes.isEmpty()) {
        panes = defaultState().panes;
        return true;
    }
    if (panes.size() > LayoutConstants::MaxPanes) {
        panes.resize(LayoutConstants::MaxPanes);
    }
    for (Pane& pane : panes) {
        pane.size = qMax(0.0, pane.size);
    }

    if (qAbs(sumSizes(panes) - LayoutConstants::TotalSize) > LayoutConstants::SizeEpsilon) {
        scaleToTotal(panes);
    }

    return panes != before;
}

void LayoutStore::syncState(const LayoutSnapshot& snapshot)
{
    const LayoutState previous = m_state;

    if (snapshot.panes) {
        QVector<Pane> panes = *snapshot.panes;
        if (normalizePanes(panes)) {
            qCWarning(lcLayout) << "Incoming pane list violated the layout constraints, repaired to"
                                << panes.size() << "panes";
        }
        m_state.panes = panes;
    }
    if (snapshot.activePaneId) {
        m_state.activePaneId = *snapshot.activePaneId;
    }
    if (snapshot.isChatOpen) {
        m_state.isChatOpen = *snapshot.isChatOpen;
    }
    if (snapshot.isTerminalOpen) {
        m_state.isTerminalOpen = *snapshot.isTerminalOpen;
    }

    if (!m_state.activePaneId.isEmpty() && m_state.paneIndex(m_state.activePaneId) < 0) {
        m_state.activePaneId = m_state.panes.constFirst().id;
    }

    commit(previous);
}

void LayoutStore::commit(const LayoutState& previous)
{
    if (m_state == previous) {
        return;
    }

    Q_EMIT stateChanged(previous, m_state);

    if (m_state.panes != previous.panes) {
        Q_EMIT panesChanged();
    }
    if (m_state.activePaneId != previous.activePaneId) {
        Q_EMIT activePaneIdChanged();
    }
    if (m_state.isChatOpen != previous.isChatOpen) {
        Q_EMIT chatOpenChanged();
    }
    if (m_state.isTerminalOpen != previous.isTerminalOpen) {
        Q_EMIT terminalOpenChanged();
    }
    if (m_state.chatWidth != previous.chatWidth || m_state.sidebarWidth != previous.sidebarWidth) {
        Q_EMIT panelGeometryChanged();
    }
}

} // namespace PaneSync

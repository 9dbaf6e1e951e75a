// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>
#include <QString>

namespace PaneSync {

/**
 * @brief D-Bus constants for the cross-window event bus
 *
 * Every window process broadcasts on the same object path and interface.
 * There is no owning service: receivers match the signal from any sender.
 */
namespace DBus {
inline const QString ObjectPath = QStringLiteral("/PaneSync");

namespace Interface {
inline const QString Sync = QStringLiteral("org.panesync.Sync");
}

namespace Signal {
// event(channel: s, payload: s)
inline const QString Event = QStringLiteral("event");
}
}

/**
 * @brief Channel names carried in the event signal
 */
namespace Channel {
inline const QString SyncState = QStringLiteral("sync-state");
inline const QString WindowReady = QStringLiteral("window-ready");
}

/**
 * @brief Store discriminators used in SyncMessage::store
 */
namespace StoreName {
inline constexpr QLatin1String File{"file"};
inline constexpr QLatin1String Layout{"layout"};
}

/**
 * @brief Default values for protocol timing and drag arbitration
 *
 * User-configurable values live in panesync.kcfg (see ConfigDefaults);
 * these are the fallbacks for code that runs without Settings.
 */
namespace Defaults {
constexpr int HandshakeGraceMs = 200; // Lets a new window's listeners attach before the reply
constexpr int DragPollIntervalMs = 50; // Hit-test cadence during external drags (20 Hz)
inline const QString ChatRegionMarker = QStringLiteral("chat-panel");
inline const QString DefaultPaneId = QStringLiteral("pane-1");
constexpr int ChatWidth = 384;
constexpr int SidebarWidth = 250;
}

/**
 * @brief Pane layout constraints (sizes are percentages of the editor area)
 */
namespace LayoutConstants {
constexpr int MaxPanes = 4;
constexpr qreal MinPaneSize = 20.0;
constexpr qreal TotalSize = 100.0;
constexpr qreal SizeEpsilon = 0.5; // Tolerance for "sums to 100" after 0.1 rounding
constexpr int MinSidebarWidth = 150;
constexpr int MaxSidebarWidth = 500;
}

/**
 * @brief JSON keys for wire messages and snapshots
 */
namespace JsonKeys {
// Envelope keys
inline constexpr QLatin1String Origin{"origin"};
inline constexpr QLatin1String Store{"store"};
inline constexpr QLatin1String State{"state"};

// File snapshot keys
inline constexpr QLatin1String OpenedFiles{"openedFiles"};
inline constexpr QLatin1String ActiveFileId{"activeFileId"};
inline constexpr QLatin1String RootPath{"rootPath"};
inline constexpr QLatin1String Id{"id"};
inline constexpr QLatin1String Path{"path"};
inline constexpr QLatin1String Name{"name"};
inline constexpr QLatin1String IsDirty{"isDirty"};
inline constexpr QLatin1String Language{"language"};
inline constexpr QLatin1String Content{"content"};
inline constexpr QLatin1String InitialLine{"initialLine"};

// Layout snapshot keys
inline constexpr QLatin1String Panes{"panes"};
inline constexpr QLatin1String FileId{"fileId"};
inline constexpr QLatin1String Size{"size"};
inline constexpr QLatin1String Position{"position"};
inline constexpr QLatin1String X{"x"};
inline constexpr QLatin1String Y{"y"};
inline constexpr QLatin1String ActivePaneId{"activePaneId"};
inline constexpr QLatin1String IsChatOpen{"isChatOpen"};
inline constexpr QLatin1String IsTerminalOpen{"isTerminalOpen"};
}

} // namespace PaneSync

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/logging.h"

namespace PaneSync {

namespace {
constexpr int HandshakeGraceMsMin = 0;
constexpr int HandshakeGraceMsMax = 5000;
constexpr int PollIntervalMsMin = 10;
constexpr int PollIntervalMsMax = 1000;

const QString SyncGroup = QStringLiteral("Sync");
const QString DragDropGroup = QStringLiteral("DragDrop");
const QString NotificationsGroup = QStringLiteral("Notifications");
}

// Simple setter: apply if changed, emit the property and aggregate signal
#define SETTINGS_SETTER(Type, name, member, signal) \
    void Settings::set##name(Type value) \
    { \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

// Clamped int setter: clamp value with a warning, then apply if changed
#define SETTINGS_SETTER_CLAMPED(name, member, signal, minVal, maxVal) \
    void Settings::set##name(int value) \
    { \
        if (value < minVal || value > maxVal) { \
            qCWarning(lcConfig) << #name << "out of range:" << value << "clamping to" << minVal << "-" << maxVal; \
            value = qBound(minVal, value, maxVal); \
        } \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

Settings::Settings(KSharedConfig::Ptr config, QObject* parent)
    : QObject(parent)
    , m_config(config ? config : KSharedConfig::openConfig(QStringLiteral("panesyncrc")))
{
    load();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═══════════════════════════════════════════════════════════════════════════════

int Settings::readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                               const char* settingName)
{
    const int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "clamping to" << min << "-" << max;
        return qBound(min, value, max);
    }
    return value;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Setters
// ═══════════════════════════════════════════════════════════════════════════════

SETTINGS_SETTER(bool, SyncEnabled, m_syncEnabled, syncEnabledChanged)
SETTINGS_SETTER_CLAMPED(HandshakeGraceMs, m_handshakeGraceMs, handshakeGraceMsChanged, HandshakeGraceMsMin,
                        HandshakeGraceMsMax)
SETTINGS_SETTER_CLAMPED(PollIntervalMs, m_pollIntervalMs, pollIntervalMsChanged, PollIntervalMsMin,
                        PollIntervalMsMax)
SETTINGS_SETTER(bool, UsePlasmaOsd, m_usePlasmaOsd, usePlasmaOsdChanged)

void Settings::setChatRegionMarker(const QString& objectName)
{
    QString value = objectName.trimmed();
    if (value.isEmpty()) {
        qCWarning(lcConfig) << "Empty chat region marker, using default";
        value = ConfigDefaults::chatRegionMarker();
    }
    if (m_chatRegionMarker != value) {
        m_chatRegionMarker = value;
        Q_EMIT chatRegionMarkerChanged();
        Q_EMIT settingsChanged();
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Persistence
// ═══════════════════════════════════════════════════════════════════════════════

void Settings::load()
{
    // Another window may have written the file since this config was opened
    m_config->reparseConfiguration();

    const KConfigGroup sync = m_config->group(SyncGroup);
    const KConfigGroup dragDrop = m_config->group(DragDropGroup);
    const KConfigGroup notifications = m_config->group(NotificationsGroup);

    m_syncEnabled = sync.readEntry(QLatin1String("Enabled"), ConfigDefaults::syncEnabled());
    m_handshakeGraceMs = readValidatedInt(sync, "HandshakeGraceMs", ConfigDefaults::handshakeGraceMs(),
                                          HandshakeGraceMsMin, HandshakeGraceMsMax, "handshake grace");

    m_pollIntervalMs = readValidatedInt(dragDrop, "PollIntervalMs", ConfigDefaults::pollIntervalMs(),
                                        PollIntervalMsMin, PollIntervalMsMax, "drag poll interval");
    m_chatRegionMarker = dragDrop.readEntry(QLatin1String("ChatRegionMarker"), ConfigDefaults::chatRegionMarker());
    if (m_chatRegionMarker.trimmed().isEmpty()) {
        qCWarning(lcConfig) << "Empty chat region marker in config, using default";
        m_chatRegionMarker = ConfigDefaults::chatRegionMarker();
    }

    m_usePlasmaOsd = notifications.readEntry(QLatin1String("UsePlasmaOsd"), ConfigDefaults::usePlasmaOsd());

    qCDebug(lcConfig) << "Settings loaded: sync" << m_syncEnabled << "grace" << m_handshakeGraceMs << "ms poll"
                      << m_pollIntervalMs << "ms marker" << m_chatRegionMarker;
    Q_EMIT settingsChanged();
}

void Settings::save()
{
    KConfigGroup sync = m_config->group(SyncGroup);
    KConfigGroup dragDrop = m_config->group(DragDropGroup);
    KConfigGroup notifications = m_config->group(NotificationsGroup);

    sync.writeEntry(QLatin1String("Enabled"), m_syncEnabled);
    sync.writeEntry(QLatin1String("HandshakeGraceMs"), m_handshakeGraceMs);
    dragDrop.writeEntry(QLatin1String("PollIntervalMs"), m_pollIntervalMs);
    dragDrop.writeEntry(QLatin1String("ChatRegionMarker"), m_chatRegionMarker);
    notifications.writeEntry(QLatin1String("UsePlasmaOsd"), m_usePlasmaOsd);

    if (!m_config->sync()) {
        qCWarning(lcConfig) << "Failed to write settings to" << m_config->name();
    }
}

void Settings::reset()
{
    setSyncEnabled(ConfigDefaults::syncEnabled());
    setHandshakeGraceMs(ConfigDefaults::handshakeGraceMs());
    setPollIntervalMs(ConfigDefaults::pollIntervalMs());
    setChatRegionMarker(ConfigDefaults::chatRegionMarker());
    setUsePlasmaOsd(ConfigDefaults::usePlasmaOsd());
}

} // namespace PaneSync

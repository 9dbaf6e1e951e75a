// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include <KConfigGroup>
#include <KSharedConfig>
#include <QObject>
#include <QString>

namespace PaneSync {

/**
 * @brief Per-user settings for PaneSync windows
 *
 * Backed by KConfig (panesyncrc). Defaults and ranges come from
 * panesync.kcfg via ConfigDefaults. Out-of-range values read from disk or
 * passed to setters are clamped and a warning is logged.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class PANESYNC_EXPORT Settings : public QObject
{
    Q_OBJECT

    Q_PROPERTY(bool syncEnabled READ syncEnabled WRITE setSyncEnabled NOTIFY syncEnabledChanged)
    Q_PROPERTY(int handshakeGraceMs READ handshakeGraceMs WRITE setHandshakeGraceMs NOTIFY handshakeGraceMsChanged)
    Q_PROPERTY(int pollIntervalMs READ pollIntervalMs WRITE setPollIntervalMs NOTIFY pollIntervalMsChanged)
    Q_PROPERTY(QString chatRegionMarker READ chatRegionMarker WRITE setChatRegionMarker NOTIFY
                   chatRegionMarkerChanged)
    Q_PROPERTY(bool usePlasmaOsd READ usePlasmaOsd WRITE setUsePlasmaOsd NOTIFY usePlasmaOsdChanged)

public:
    /**
     * @param config Config to read from; defaults to panesyncrc
     */
    explicit Settings(KSharedConfig::Ptr config = KSharedConfig::Ptr(), QObject* parent = nullptr);
    ~Settings() override = default;

    bool syncEnabled() const
    {
        return m_syncEnabled;
    }
    void setSyncEnabled(bool enabled);

    int handshakeGraceMs() const
    {
        return m_handshakeGraceMs;
    }
    void setHandshakeGraceMs(int ms);

    int pollIntervalMs() const
    {
        return m_pollIntervalMs;
    }
    void setPollIntervalMs(int ms);

    QString chatRegionMarker() const
    {
        return m_chatRegionMarker;
    }
    void setChatRegionMarker(const QString& objectName);

    bool usePlasmaOsd() const
    {
        return m_usePlasmaOsd;
    }
    void setUsePlasmaOsd(bool enabled);

    void load();
    void save();
    void reset();

Q_SIGNALS:
    void settingsChanged();
    void syncEnabledChanged();
    void handshakeGraceMsChanged();
    void pollIntervalMsChanged();
    void chatRegionMarkerChanged();
    void usePlasmaOsdChanged();

private:
    static int readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                                const char* settingName);

    KSharedConfig::Ptr m_config;

    bool m_syncEnabled = true;
    int m_handshakeGraceMs = 200;
    int m_pollIntervalMs = 50;
    QString m_chatRegionMarker;
    bool m_usePlasmaOsd = true;
};

} // namespace PaneSync

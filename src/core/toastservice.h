// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "interfaces.h"

namespace PaneSync {

/**
 * @brief Toast surface backed by the Plasma OSD service
 *
 * Every toast is emitted as toastRequested() for the host window. When
 * Plasma OSD is enabled the text is also sent to org.kde.osdService on
 * the session bus without waiting for a reply.
 */
class PANESYNC_EXPORT ToastService : public INotifier
{
    Q_OBJECT

public:
    explicit ToastService(QObject* parent = nullptr);

    void showError(const QString& title, const QString& message) override;

    bool usePlasmaOsd() const
    {
        return m_usePlasmaOsd;
    }
    void setUsePlasmaOsd(bool enabled)
    {
        m_usePlasmaOsd = enabled;
    }

private:
    bool m_usePlasmaOsd = true;
};

} // namespace PaneSync

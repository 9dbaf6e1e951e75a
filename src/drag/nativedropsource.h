// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include <QObject>
#include <QPointer>
#include <QStringList>

class QMimeData;

namespace PaneSync {

/**
 * @brief Turns drops of files onto the window into a list of absolute paths
 *
 * filesDropped() is the host-native "files dropped on window" event: it
 * carries paths only, in the order of the drag payload. URLs that are not
 * local files are skipped with a warning.
 */
class PANESYNC_EXPORT NativeDropSource : public QObject
{
    Q_OBJECT

public:
    explicit NativeDropSource(QObject* parent = nullptr);
    ~NativeDropSource() override;

    void install(QObject* target);
    void uninstall();

    /**
     * @brief Local file paths carried by a drag payload
     */
    static QStringList localPaths(const QMimeData* mimeData);

    bool eventFilter(QObject* watched, QEvent* event) override;

Q_SIGNALS:
    void filesDropped(const QStringList& paths);

private:
    QPointer<QObject> m_target;
};

} // namespace PaneSync

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nativedropsource.h"
#include "../core/logging.h"
#include <QDropEvent>
#include <QMimeData>
#include <QUrl>

namespace PaneSync {

NativeDropSource::NativeDropSource(QObject* parent)
    : QObject(parent)
{
}

NativeDropSource::~NativeDropSource()
{
    uninstall();
}

void NativeDropSource::install(QObject* target)
{
    uninstall();
    if (!target) {
        return;
    }
    m_target = target;
    m_target->installEventFilter(this);
}

void NativeDropSource::uninstall()
{
    if (m_target) {
        m_target->removeEventFilter(this);
    }
    m_target.clear();
}

QStringList NativeDropSource::localPaths(const QMimeData* mimeData)
{
    QStringList paths;
    if (!mimeData || !mimeData->hasUrls()) {
        return paths;
    }

    const QList<QUrl> urls = mimeData->urls();
    for (const QUrl& url : urls) {
        if (!url.isLocalFile()) {
            qCWarning(lcDrop) << "Skipping dropped URL that is not a local file:" << url.toDisplayString();
            continue;
        }
        paths.append(url.toLocalFile());
    }
    return paths;
}

bool NativeDropSource::eventFilter(QObject* watched, QEvent* event)
{
    Q_UNUSED(watched)

    if (event->type() != QEvent::Drop) {
        return false;
    }

    auto* dropEvent = static_cast<QDropEvent*>(event);
    const QStringList paths = localPaths(dropEvent->mimeData());
    if (paths.isEmpty()) {
        return false;
    }

    dropEvent->acceptProposedAction();
    qCDebug(lcDrop) << "Files dropped:" << paths;
    Q_EMIT filesDropped(paths);
    return false;
}

} // namespace PaneSync

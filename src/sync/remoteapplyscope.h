// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "broadcasttrigger.h"

namespace PaneSync {

/**
 * @brief RAII helper that suspends broadcasting while remote state is applied
 *
 * Store mutations made inside the scope are not re-published, so a window
 * never echoes a snapshot it just received.
 *
 * Usage:
 * @code
 * {
 *     RemoteApplyScope scope(m_trigger);
 *     m_fileStore->syncState(snapshot);
 * } // broadcasting resumes here
 * @endcode
 */
class RemoteApplyScope
{
public:
    /**
     * @param trigger Trigger to suspend (can be null)
     */
    explicit RemoteApplyScope(BroadcastTrigger* trigger)
        : m_trigger(trigger)
    {
        if (m_trigger) {
            m_trigger->suspend();
        }
    }

    ~RemoteApplyScope()
    {
        if (m_trigger) {
            m_trigger->resume();
        }
    }

    RemoteApplyScope(const RemoteApplyScope&) = delete;
    RemoteApplyScope& operator=(const RemoteApplyScope&) = delete;

private:
    QPointer<BroadcastTrigger> m_trigger;
};

} // namespace PaneSync

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include "../core/logging.h"
#include <QHash>
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QVector>
#include <functional>

namespace PaneSync {

/**
 * @brief Removes whatever a listen() call (or a whole session) registered
 *
 * An empty Teardown is valid and means "nothing to undo". Calling a
 * Teardown more than once is harmless.
 */
using Teardown = std::function<void()>;

/**
 * @brief Abstract cross-window event bus and window identity
 *
 * Concrete transports deliver payloads asynchronously to every live window,
 * the publishing window included, and hand them to dispatch(). Handler
 * bookkeeping lives here so every transport tears down the same way.
 *
 * Typed helpers accept any message type with toJson() and a static
 * fromJson() returning std::optional; payloads that do not parse are
 * dropped with a warning before the handler is called.
 */
class PANESYNC_EXPORT EventTransport : public QObject
{
    Q_OBJECT

public:
    using Handler = std::function<void(const QJsonObject&)>;

    explicit EventTransport(QObject* parent = nullptr);
    ~EventTransport() override;

    /**
     * @brief Whether the underlying pub/sub primitive can be used at all
     */
    virtual bool isAvailable() const = 0;

    /**
     * @brief Identity of this window, stable for the process lifetime
     */
    virtual QString windowLabel() const = 0;

    /**
     * @brief Send a payload to every window listening on @p channel
     * @return false if the payload could not be handed to the bus
     */
    virtual bool publish(const QString& channel, const QJsonObject& payload) = 0;

    /**
     * @brief Register a handler for a channel
     * @return Teardown that unregisters this handler
     */
    Teardown listen(const QString& channel, Handler handler);

    template<typename T>
    Teardown listen(const QString& channel, std::function<void(const T&)> handler)
    {
        return listen(channel, Handler([channel, handler](const QJsonObject& payload) {
            const auto message = T::fromJson(payload);
            if (!message) {
                qCWarning(lcTransport) << "Dropping malformed message on channel" << channel;
                return;
            }
            handler(*message);
        }));
    }

    template<typename T>
    bool publish(const QString& channel, const T& message)
    {
        return publish(channel, message.toJson());
    }

    int listenerCount(const QString& channel) const;

protected:
    /**
     * @brief Deliver a received payload to every handler of @p channel
     *
     * Handlers registered or removed while dispatching take effect on the
     * next payload.
     */
    void dispatch(const QString& channel, const QJsonObject& payload);

private:
    struct Listener {
        quint64 id;
        Handler handler;
    };

    void removeListener(const QString& channel, quint64 id);

    QHash<QString, QVector<Listener>> m_listeners;
    quint64 m_nextListenerId = 1;
};

} // namespace PaneSync

// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "syncmessage.h"
#include "../core/constants.h"

namespace PaneSync {

QJsonObject SyncMessage::toJson() const
{
    QJsonObject json;
    json[JsonKeys::Origin] = origin;
    json[JsonKeys::Store] = store;
    json[JsonKeys::State] = state;
    return json;
}

std::optional<SyncMessage> SyncMessage::fromJson(const QJsonObject& json)
{
    const QJsonValue origin = json.value(JsonKeys::Origin);
    const QJsonValue store = json.value(JsonKeys::Store);
    const QJsonValue state = json.value(JsonKeys::State);
    if (!origin.isString() || origin.toString().isEmpty() || !store.isString() || !state.isObject()) {
        return std::nullopt;
    }

    SyncMessage message;
    message.origin = origin.toString();
    message.store = store.toString();
    message.state = state.toObject();
    return message;
}

QJsonObject ReadyMessage::toJson() const
{
    QJsonObject json;
    json[JsonKeys::Origin] = origin;
    return json;
}

std::optional<ReadyMessage> ReadyMessage::fromJson(const QJsonObject& json)
{
    const QJsonValue origin = json.value(JsonKeys::Origin);
    if (!origin.isString() || origin.toString().isEmpty()) {
        return std::nullopt;
    }
    return ReadyMessage{origin.toString()};
}

} // namespace PaneSync

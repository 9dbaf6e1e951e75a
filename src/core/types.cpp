// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "types.h"
#include "constants.h"
#include <QJsonArray>

namespace PaneSync {

bool OpenedFile::operator==(const OpenedFile& other) const
{
    return id == other.id && path == other.path && name == other.name && content == other.content
        && isDirty == other.isDirty && language == other.language && initialLine == other.initialLine;
}

bool FileNode::operator==(const FileNode& other) const
{
    return id == other.id && name == other.name && path == other.path && isDirectory == other.isDirectory
        && children == other.children;
}

const OpenedFile* FileState::fileById(const QString& id) const
{
    if (id.isEmpty()) {
        return nullptr;
    }
    for (const OpenedFile& file : openedFiles) {
        if (file.id == id) {
            return &file;
        }
    }
    return nullptr;
}

const OpenedFile* FileState::fileByPath(const QString& path) const
{
    if (path.isEmpty()) {
        return nullptr;
    }
    for (const OpenedFile& file : openedFiles) {
        if (file.path == path) {
            return &file;
        }
    }
    return nullptr;
}

QStringList FileState::openedFileIds() const
{
    QStringList ids;
    ids.reserve(openedFiles.size());
    for (const OpenedFile& file : openedFiles) {
        ids.append(file.id);
    }
    return ids;
}

bool FileState::operator==(const FileState& other) const
{
    return fileTree == other.fileTree && rootPath == other.rootPath && openedFiles == other.openedFiles
        && activeFileId == other.activeFileId;
}

bool Pane::operator==(const Pane& other) const
{
    // Exact size comparison: sizes travel as JSON doubles and round-trip losslessly
    return id == other.id && fileId == other.fileId && size == other.size && position == other.position;
}

const Pane* LayoutState::paneById(const QString& id) const
{
    const int index = paneIndex(id);
    return index >= 0 ? &panes.at(index) : nullptr;
}

int LayoutState::paneIndex(const QString& id) const
{
    for (int i = 0; i < panes.size(); ++i) {
        if (panes.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

qreal LayoutState::totalPaneSize() const
{
    qreal total = 0.0;
    for (const Pane& pane : panes) {
        total += pane.size;
    }
    return total;
}

bool LayoutState::operator==(const LayoutState& other) const
{
    return isChatOpen == other.isChatOpen && isTerminalOpen == other.isTerminalOpen
        && isCommandPaletteOpen == other.isCommandPaletteOpen && isSettingsOpen == other.isSettingsOpen
        && isSidebarOpen == other.isSidebarOpen && chatWidth == other.chatWidth && sidebarWidth == other.sidebarWidth
        && panes == other.panes && activePaneId == other.activePaneId && splitDirection == other.splitDirection;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Snapshot serialization
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

QJsonObject openedFileToJson(const OpenedFile& file)
{
    QJsonObject json;
    json[JsonKeys::Id] = file.id;
    json[JsonKeys::Path] = file.path;
    json[JsonKeys::Name] = file.name;
    json[JsonKeys::IsDirty] = file.isDirty;
    json[JsonKeys::Language] = file.language;
    json[JsonKeys::Content] = file.content;
    if (file.initialLine) {
        json[JsonKeys::InitialLine] = *file.initialLine;
    }
    return json;
}

std::optional<OpenedFile> openedFileFromJson(const QJsonObject& json)
{
    OpenedFile file;
    file.id = json[JsonKeys::Id].toString();
    if (file.id.isEmpty()) {
        return std::nullopt;
    }
    file.path = json[JsonKeys::Path].toString();
    file.name = json[JsonKeys::Name].toString();
    file.isDirty = json[JsonKeys::IsDirty].toBool(false);
    file.language = json[JsonKeys::Language].toString();
    file.content = json[JsonKeys::Content].toString();
    if (json[JsonKeys::InitialLine].isDouble()) {
        file.initialLine = json[JsonKeys::InitialLine].toInt();
    }
    return file;
}

QJsonObject paneToJson(const Pane& pane)
{
    QJsonObject json;
    json[JsonKeys::Id] = pane.id;
    if (!pane.fileId.isEmpty()) {
        json[JsonKeys::FileId] = pane.fileId;
    }
    json[JsonKeys::Size] = pane.size;

    QJsonObject position;
    position[JsonKeys::X] = pane.position.x();
    position[JsonKeys::Y] = pane.position.y();
    json[JsonKeys::Position] = position;
    return json;
}

std::optional<Pane> paneFromJson(const QJsonObject& json)
{
    Pane pane;
    pane.id = json[JsonKeys::Id].toString();
    if (pane.id.isEmpty()) {
        return std::nullopt;
    }
    pane.fileId = json[JsonKeys::FileId].toString();
    pane.size = json[JsonKeys::Size].toDouble(0.0);

    const QJsonObject position = json[JsonKeys::Position].toObject();
    pane.position = QPointF(position[JsonKeys::X].toDouble(0.0), position[JsonKeys::Y].toDouble(0.0));
    return pane;
}

} // namespace

QJsonObject FileSnapshot::toJson() const
{
    QJsonObject json;
    if (openedFiles) {
        QJsonArray files;
        for (const OpenedFile& file : *openedFiles) {
            files.append(openedFileToJson(file));
        }
        json[JsonKeys::OpenedFiles] = files;
    }
    if (activeFileId) {
        json[JsonKeys::ActiveFileId] = activeFileId->isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(*activeFileId);
    }
    if (rootPath) {
        json[JsonKeys::RootPath] = rootPath->isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(*rootPath);
    }
    return json;
}

FileSnapshot FileSnapshot::fromJson(const QJsonObject& json)
{
    FileSnapshot snapshot;

    const QJsonValue files = json.value(JsonKeys::OpenedFiles);
    if (files.isArray()) {
        QVector<OpenedFile> parsed;
        const QJsonArray array = files.toArray();
        for (const QJsonValue& value : array) {
            if (auto file = openedFileFromJson(value.toObject())) {
                parsed.append(*file);
            }
        }
        snapshot.openedFiles = parsed;
    }

    // null is a present field meaning "none"
    const QJsonValue active = json.value(JsonKeys::ActiveFileId);
    if (active.isString() || active.isNull()) {
        snapshot.activeFileId = active.toString();
    }
    const QJsonValue root = json.value(JsonKeys::RootPath);
    if (root.isString() || root.isNull()) {
        snapshot.rootPath = root.toString();
    }
    return snapshot;
}

QJsonObject LayoutSnapshot::toJson() const
{
    QJsonObject json;
    if (panes) {
        QJsonArray array;
        for (const Pane& pane : *panes) {
            array.append(paneToJson(pane));
        }
        json[JsonKeys::Panes] = array;
    }
    if (activePaneId) {
        json[JsonKeys::ActivePaneId] = activePaneId->isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(*activePaneId);
    }
    if (isChatOpen) {
        json[JsonKeys::IsChatOpen] = *isChatOpen;
    }
    if (isTerminalOpen) {
        json[JsonKeys::IsTerminalOpen] = *isTerminalOpen;
    }
    return json;
}

LayoutSnapshot LayoutSnapshot::fromJson(const QJsonObject& json)
{
    LayoutSnapshot snapshot;

    const QJsonValue panesValue = json.value(JsonKeys::Panes);
    if (panesValue.isArray()) {
        QVector<Pane> parsed;
        const QJsonArray array = panesValue.toArray();
        for (const QJsonValue& value : array) {
            if (auto pane = paneFromJson(value.toObject())) {
                parsed.append(*pane);
            }
        }
        snapshot.panes = parsed;
    }

    const QJsonValue active = json.value(JsonKeys::ActivePaneId);
    if (active.isString() || active.isNull()) {
        snapshot.activePaneId = active.toString();
    }
    const QJsonValue chat = json.value(JsonKeys::IsChatOpen);
    if (chat.isBool()) {
        snapshot.isChatOpen = chat.toBool();
    }
    const QJsonValue terminal = json.value(JsonKeys::IsTerminalOpen);
    if (terminal.isBool()) {
        snapshot.isTerminalOpen = terminal.toBool();
    }
    return snapshot;
}

} // namespace PaneSync

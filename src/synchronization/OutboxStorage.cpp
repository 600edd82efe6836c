/*
 * Copyright 2024 Dmitry Ivanov
 *
 * This file is part of libhealthsync
 *
 * libhealthsync is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, version 3 of the License.
 *
 * libhealthsync is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with libhealthsync. If not, see <http://www.gnu.org/licenses/>.
 */

#include "OutboxStorage.h"

#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/exception/RuntimeError.h>
#include <healthsync/logging/HealthSyncLogger.h>

#include "Utils.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QSaveFile>
#include <QUuid>

#include <algorithm>
#include <cmath>
#include <string_view>

namespace healthsync::synchronization {

using namespace std::string_view_literals;

namespace {

constexpr auto gOutboxDirName = "outbox"sv;

constexpr auto gIdKey = "id"sv;
constexpr auto gUserKeyKey = "userKey"sv;
constexpr auto gTypeTagKey = "typeTag"sv;
constexpr auto gPayloadKey = "payload"sv;
constexpr auto gCursorsKey = "cursors"sv;
constexpr auto gFullExportKey = "fullExport"sv;
constexpr auto gRecordCountKey = "recordCount"sv;
constexpr auto gCreatedAtKey = "createdAt"sv;
constexpr auto gSequenceKey = "sequence"sv;

[[nodiscard]] QString toStr(const std::string_view key)
{
    return synchronization::toString(key);
}

[[nodiscard]] QString itemFileName(const QString & id)
{
    return id + QStringLiteral(".json");
}

[[nodiscard]] QJsonObject serializeOutboxItem(const OutboxItem & item)
{
    QJsonObject object;
    object[toStr(gIdKey)] = item.id;
    object[toStr(gUserKeyKey)] = item.userKey;
    object[toStr(gTypeTagKey)] = item.typeTag;
    object[toStr(gPayloadKey)] = QString::fromLatin1(item.payload.toBase64());

    QJsonObject cursors;
    for (auto it = item.cursors.constBegin(), end = item.cursors.constEnd();
         it != end; ++it)
    {
        cursors[it.key()] = QString::fromLatin1(it.value().toBase64());
    }
    object[toStr(gCursorsKey)] = cursors;

    object[toStr(gFullExportKey)] = item.fullExport;
    object[toStr(gRecordCountKey)] = item.recordCount;
    object[toStr(gCreatedAtKey)] = item.createdAt.toString(Qt::ISODateWithMs);
    object[toStr(gSequenceKey)] = static_cast<double>(item.sequence);
    return object;
}

[[nodiscard]] std::optional<QByteArray> fromBase64(const QJsonValue & value)
{
    if (!value.isString()) {
        return std::nullopt;
    }

    auto decoded = QByteArray::fromBase64Encoding(value.toString().toLatin1());
    if (!decoded) {
        return std::nullopt;
    }

    return std::move(*decoded);
}

[[nodiscard]] std::optional<OutboxItem> deserializeOutboxItem(
    const QJsonObject & json)
{
    OutboxItem item;

    const auto idIt = json.constFind(toStr(gIdKey));
    if (idIt == json.constEnd() || !idIt->isString()) {
        return std::nullopt;
    }
    item.id = idIt->toString();

    const auto userKeyIt = json.constFind(toStr(gUserKeyKey));
    if (userKeyIt == json.constEnd() || !userKeyIt->isString()) {
        return std::nullopt;
    }
    item.userKey = userKeyIt->toString();

    const auto typeTagIt = json.constFind(toStr(gTypeTagKey));
    if (typeTagIt == json.constEnd() || !typeTagIt->isString()) {
        return std::nullopt;
    }
    item.typeTag = typeTagIt->toString();

    const auto payloadIt = json.constFind(toStr(gPayloadKey));
    if (payloadIt == json.constEnd()) {
        return std::nullopt;
    }

    auto payload = fromBase64(*payloadIt);
    if (!payload) {
        return std::nullopt;
    }
    item.payload = std::move(*payload);

    const auto cursorsIt = json.constFind(toStr(gCursorsKey));
    if (cursorsIt == json.constEnd() || !cursorsIt->isObject()) {
        return std::nullopt;
    }

    const QJsonObject cursors = cursorsIt->toObject();
    for (auto it = cursors.constBegin(), end = cursors.constEnd(); it != end;
         ++it)
    {
        auto cursor = fromBase64(it.value());
        if (!cursor) {
            return std::nullopt;
        }
        item.cursors[it.key()] = std::move(*cursor);
    }

    const auto fullExportIt = json.constFind(toStr(gFullExportKey));
    if (fullExportIt == json.constEnd() || !fullExportIt->isBool()) {
        return std::nullopt;
    }
    item.fullExport = fullExportIt->toBool();

    const auto recordCountIt = json.constFind(toStr(gRecordCountKey));
    if (recordCountIt == json.constEnd() || !recordCountIt->isDouble()) {
        return std::nullopt;
    }
    item.recordCount = recordCountIt->toInt();

    const auto createdAtIt = json.constFind(toStr(gCreatedAtKey));
    if (createdAtIt == json.constEnd() || !createdAtIt->isString()) {
        return std::nullopt;
    }

    item.createdAt =
        QDateTime::fromString(createdAtIt->toString(), Qt::ISODateWithMs);
    if (!item.createdAt.isValid()) {
        return std::nullopt;
    }

    const auto sequenceIt = json.constFind(toStr(gSequenceKey));
    if (sequenceIt == json.constEnd() || !sequenceIt->isDouble()) {
        return std::nullopt;
    }
    item.sequence = static_cast<qint64>(std::llround(sequenceIt->toDouble()));

    return item;
}

[[nodiscard]] std::optional<OutboxItem> readItemFile(const QString & filePath)
{
    QFile file{filePath};
    if (Q_UNLIKELY(!file.open(QIODevice::ReadOnly))) {
        HSWARNING(
            "synchronization::OutboxStorage",
            "Failed to open outbox item file for reading: "
                << filePath << " (" << file.errorString() << ")");
        return std::nullopt;
    }

    const QByteArray contents = file.readAll();
    file.close();

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(contents, &error);
    if (Q_UNLIKELY(doc.isNull() || !doc.isObject())) {
        HSWARNING(
            "synchronization::OutboxStorage",
            "Failed to parse outbox item file " << filePath << ": "
                                                << error.errorString());
        return std::nullopt;
    }

    auto item = deserializeOutboxItem(doc.object());
    if (Q_UNLIKELY(!item)) {
        HSWARNING(
            "synchronization::OutboxStorage",
            "Failed to deserialize outbox item from file " << filePath);
    }

    return item;
}

} // namespace

QTextStream & OutboxItem::print(QTextStream & strm) const
{
    strm << "OutboxItem: id = " << id << ", user key = " << userKey
         << ", type = " << typeTag << ", records = " << recordCount
         << ", payload size = " << payload.size()
         << ", cursors = " << cursors.size()
         << ", full export = " << (fullExport ? "true" : "false")
         << ", created at = " << createdAt.toString(Qt::ISODateWithMs)
         << ", sequence = " << sequence;
    return strm;
}

OutboxStorage::OutboxStorage(QDir rootDir) : m_rootDir{std::move(rootDir)}
{
    if (Q_UNLIKELY(m_rootDir.path().isEmpty())) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "OutboxStorage ctor: root dir path is empty")}};
    }
}

OutboxItem OutboxStorage::put(OutboxItem item)
{
    item.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    item.sequence = nextSequence();
    item.createdAt = QDateTime::currentDateTimeUtc();

    const QDir dir = outboxDir(item.userKey);
    if (!dir.exists() && Q_UNLIKELY(!dir.mkpath(dir.absolutePath()))) {
        ErrorString error{QT_TRANSLATE_NOOP(
            "synchronization::OutboxStorage",
            "Failed to create outbox dir")};
        error.details() = dir.absolutePath();
        throw RuntimeError{std::move(error)};
    }

    QSaveFile file{dir.absoluteFilePath(itemFileName(item.id))};
    if (Q_UNLIKELY(!file.open(QIODevice::WriteOnly))) {
        ErrorString error{QT_TRANSLATE_NOOP(
            "synchronization::OutboxStorage",
            "Failed to open outbox item file for writing")};
        error.details() = file.errorString();
        throw RuntimeError{std::move(error)};
    }

    const QJsonDocument doc{serializeOutboxItem(item)};
    const QByteArray contents = doc.toJson(QJsonDocument::Compact);
    if (Q_UNLIKELY(file.write(contents) != contents.size() || !file.commit()))
    {
        ErrorString error{QT_TRANSLATE_NOOP(
            "synchronization::OutboxStorage",
            "Failed to write outbox item file")};
        error.details() = file.errorString();
        throw RuntimeError{std::move(error)};
    }

    HSDEBUG(
        "synchronization::OutboxStorage", "Staged outbox item: " << item);
    return item;
}

std::optional<OutboxItem> OutboxStorage::item(
    const QString & userKey, const QString & id) const
{
    const QString filePath = outboxDir(userKey).absoluteFilePath(
        itemFileName(id));
    if (!QFile::exists(filePath)) {
        return std::nullopt;
    }

    return readItemFile(filePath);
}

QList<OutboxItem> OutboxStorage::items(const QString & userKey) const
{
    const QDir dir = outboxDir(userKey);
    if (!dir.exists()) {
        return {};
    }

    const auto fileNames = dir.entryList(
        QStringList{QStringLiteral("*.json")},
        QDir::Files | QDir::NoDotAndDotDot);

    QList<OutboxItem> result;
    result.reserve(fileNames.size());

    for (const auto & fileName: std::as_const(fileNames)) {
        const QString filePath = dir.absoluteFilePath(fileName);
        auto item = readItemFile(filePath);
        if (!item) {
            // Corrupted item cannot be delivered anyway
            if (Q_UNLIKELY(!QFile::remove(filePath))) {
                HSWARNING(
                    "synchronization::OutboxStorage",
                    "Failed to remove unreadable outbox item file "
                        << filePath);
            }
            continue;
        }

        result << std::move(*item);
    }

    std::sort(
        result.begin(), result.end(),
        [](const OutboxItem & lhs, const OutboxItem & rhs) {
            return lhs.sequence < rhs.sequence;
        });

    return result;
}

bool OutboxStorage::remove(const QString & userKey, const QString & id)
{
    const QString filePath =
        outboxDir(userKey).absoluteFilePath(itemFileName(id));

    if (!QFile::exists(filePath)) {
        return false;
    }

    if (Q_UNLIKELY(!QFile::remove(filePath))) {
        HSWARNING(
            "synchronization::OutboxStorage",
            "Failed to remove outbox item file " << filePath);
        return false;
    }

    HSTRACE(
        "synchronization::OutboxStorage", "Removed outbox item " << id);
    return true;
}

int OutboxStorage::removeItemsOfOtherUsers(const QString & userKey)
{
    if (!m_rootDir.exists()) {
        return 0;
    }

    int removedCount = 0;
    const auto userKeys =
        m_rootDir.entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const auto & otherUserKey: std::as_const(userKeys)) {
        if (otherUserKey == userKey) {
            continue;
        }

        const int count = size(otherUserKey);
        if (count == 0) {
            continue;
        }

        clear(otherUserKey);
        removedCount += count;

        HSINFO(
            "synchronization::OutboxStorage",
            "Removed " << count << " outbox items of another user "
                       << otherUserKey);
    }

    return removedCount;
}

void OutboxStorage::clear(const QString & userKey)
{
    QDir dir = outboxDir(userKey);
    if (dir.exists() && Q_UNLIKELY(!dir.removeRecursively())) {
        HSWARNING(
            "synchronization::OutboxStorage",
            "Failed to remove outbox dir " << dir.absolutePath());
    }
}

int OutboxStorage::size(const QString & userKey) const
{
    const QDir dir = outboxDir(userKey);
    if (!dir.exists()) {
        return 0;
    }

    return static_cast<int>(
        dir.entryList(
               QStringList{QStringLiteral("*.json")},
               QDir::Files | QDir::NoDotAndDotDot)
            .size());
}

QDir OutboxStorage::outboxDir(const QString & userKey) const
{
    return QDir{m_rootDir.absoluteFilePath(
        userKey + QStringLiteral("/") + toStr(gOutboxDirName))};
}

qint64 OutboxStorage::nextSequence()
{
    const QMutexLocker locker{&m_sequenceMutex};
    m_lastSequence =
        std::max(QDateTime::currentMSecsSinceEpoch(), m_lastSequence + 1);
    return m_lastSequence;
}

} // namespace healthsync::synchronization

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

#include <healthsync/synchronization/types/serialization/json/SyncState.h>

#include <synchronization/Utils.h>

#include <QJsonArray>

#include <cmath>
#include <string_view>
#include <utility>

namespace healthsync::synchronization {

using namespace std::string_view_literals;

namespace {

constexpr auto gUserKeyKey = "userKey"sv;
constexpr auto gFullExportKey = "fullExport"sv;
constexpr auto gCreatedAtKey = "createdAt"sv;
constexpr auto gTypeProgressKey = "typeProgress"sv;
constexpr auto gTypeIdentifierKey = "typeIdentifier"sv;
constexpr auto gSentCountKey = "sentCount"sv;
constexpr auto gRejectedCountKey = "rejectedCount"sv;
constexpr auto gIsCompleteKey = "isComplete"sv;
constexpr auto gPendingCursorKey = "pendingCursor"sv;
constexpr auto gTotalSentCountKey = "totalSentCount"sv;
constexpr auto gCompletedTypesKey = "completedTypes"sv;
constexpr auto gCurrentTypeIndexKey = "currentTypeIndex"sv;

[[nodiscard]] QString toStr(const std::string_view key)
{
    return synchronization::toString(key);
}

[[nodiscard]] QJsonObject serializeTypeProgress(const TypeProgress & progress)
{
    QJsonObject object;
    object[toStr(gTypeIdentifierKey)] = progress.type;
    object[toStr(gSentCountKey)] = static_cast<double>(progress.sentCount);
    object[toStr(gRejectedCountKey)] =
        static_cast<double>(progress.rejectedCount);
    object[toStr(gIsCompleteKey)] = progress.isComplete;

    if (progress.pendingCursor) {
        object[toStr(gPendingCursorKey)] =
            QString::fromLatin1(progress.pendingCursor->toBase64());
    }

    return object;
}

[[nodiscard]] std::optional<TypeProgress> deserializeTypeProgress(
    const QJsonObject & object)
{
    const auto typeIt = object.constFind(toStr(gTypeIdentifierKey));
    if (typeIt == object.constEnd() || !typeIt->isString()) {
        return std::nullopt;
    }

    const auto sentCountIt = object.constFind(toStr(gSentCountKey));
    if (sentCountIt == object.constEnd() || !sentCountIt->isDouble()) {
        return std::nullopt;
    }

    const auto isCompleteIt = object.constFind(toStr(gIsCompleteKey));
    if (isCompleteIt == object.constEnd() || !isCompleteIt->isBool()) {
        return std::nullopt;
    }

    TypeProgress progress;
    progress.type = typeIt->toString();
    progress.sentCount =
        static_cast<qint64>(std::llround(sentCountIt->toDouble()));
    progress.isComplete = isCompleteIt->toBool();

    // Missing rejected count means zero
    const auto rejectedCountIt = object.constFind(toStr(gRejectedCountKey));
    if (rejectedCountIt != object.constEnd()) {
        if (!rejectedCountIt->isDouble()) {
            return std::nullopt;
        }
        progress.rejectedCount =
            static_cast<qint64>(std::llround(rejectedCountIt->toDouble()));
    }

    const auto pendingCursorIt = object.constFind(toStr(gPendingCursorKey));
    if (pendingCursorIt != object.constEnd() && !pendingCursorIt->isNull()) {
        if (!pendingCursorIt->isString()) {
            return std::nullopt;
        }

        auto decoded = QByteArray::fromBase64Encoding(
            pendingCursorIt->toString().toLatin1());
        if (!decoded) {
            return std::nullopt;
        }

        progress.pendingCursor = std::move(*decoded);
    }

    return progress;
}

} // namespace

QJsonObject serializeSyncStateToJson(const SyncState & syncState)
{
    QJsonObject object;

    object[toStr(gUserKeyKey)] = syncState.userKey;
    object[toStr(gFullExportKey)] = syncState.fullExport;
    object[toStr(gCreatedAtKey)] =
        syncState.createdAt.toString(Qt::ISODateWithMs);

    QJsonArray typeProgressJson;
    for (const auto & progress: std::as_const(syncState.typeProgress)) {
        typeProgressJson << serializeTypeProgress(progress);
    }
    object[toStr(gTypeProgressKey)] = typeProgressJson;

    object[toStr(gTotalSentCountKey)] =
        static_cast<double>(syncState.totalSentCount);

    QJsonArray completedTypesJson;
    for (const auto & type: std::as_const(syncState.completedTypes)) {
        completedTypesJson << type;
    }
    object[toStr(gCompletedTypesKey)] = completedTypesJson;

    object[toStr(gCurrentTypeIndexKey)] = syncState.currentTypeIndex;
    return object;
}

std::optional<SyncState> deserializeSyncStateFromJson(const QJsonObject & json)
{
    const auto userKeyIt = json.constFind(toStr(gUserKeyKey));
    if (userKeyIt == json.constEnd() || !userKeyIt->isString()) {
        return std::nullopt;
    }

    const auto fullExportIt = json.constFind(toStr(gFullExportKey));
    if (fullExportIt == json.constEnd() || !fullExportIt->isBool()) {
        return std::nullopt;
    }

    const auto createdAtIt = json.constFind(toStr(gCreatedAtKey));
    if (createdAtIt == json.constEnd() || !createdAtIt->isString()) {
        return std::nullopt;
    }

    const auto createdAt =
        QDateTime::fromString(createdAtIt->toString(), Qt::ISODateWithMs);
    if (!createdAt.isValid()) {
        return std::nullopt;
    }

    const auto typeProgressIt = json.constFind(toStr(gTypeProgressKey));
    if (typeProgressIt == json.constEnd() || !typeProgressIt->isArray()) {
        return std::nullopt;
    }

    const auto totalSentCountIt = json.constFind(toStr(gTotalSentCountKey));
    if (totalSentCountIt == json.constEnd() || !totalSentCountIt->isDouble())
    {
        return std::nullopt;
    }

    const auto completedTypesIt = json.constFind(toStr(gCompletedTypesKey));
    if (completedTypesIt == json.constEnd() || !completedTypesIt->isArray()) {
        return std::nullopt;
    }

    const auto currentTypeIndexIt =
        json.constFind(toStr(gCurrentTypeIndexKey));
    if (currentTypeIndexIt == json.constEnd() ||
        !currentTypeIndexIt->isDouble())
    {
        return std::nullopt;
    }

    SyncState syncState;
    syncState.userKey = userKeyIt->toString();
    syncState.fullExport = fullExportIt->toBool();
    syncState.createdAt = createdAt;
    syncState.totalSentCount =
        static_cast<qint64>(std::llround(totalSentCountIt->toDouble()));
    syncState.currentTypeIndex = currentTypeIndexIt->toInt();

    if (syncState.currentTypeIndex < 0) {
        return std::nullopt;
    }

    const QJsonArray typeProgressJson = typeProgressIt->toArray();
    for (const auto & value: typeProgressJson) {
        if (!value.isObject()) {
            return std::nullopt;
        }

        auto progress = deserializeTypeProgress(value.toObject());
        if (!progress) {
            return std::nullopt;
        }

        const QString type = progress->type;
        syncState.typeProgress[type] = std::move(*progress);
    }

    const QJsonArray completedTypesJson = completedTypesIt->toArray();
    for (const auto & value: completedTypesJson) {
        if (!value.isString()) {
            return std::nullopt;
        }

        syncState.completedTypes.insert(value.toString());
    }

    return syncState;
}

} // namespace healthsync::synchronization

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

#include "SyncStateStorage.h"

#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/exception/RuntimeError.h>
#include <healthsync/logging/HealthSyncLogger.h>
#include <healthsync/synchronization/types/serialization/json/SyncState.h>

#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>

namespace healthsync::synchronization {

namespace {

const char * gStateFileName = "state.json";

} // namespace

SyncStateStorage::SyncStateStorage(QDir rootDir) :
    m_rootDir{std::move(rootDir)}
{
    if (Q_UNLIKELY(m_rootDir.path().isEmpty())) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "SyncStateStorage ctor: root dir path is empty")}};
    }
}

std::optional<SyncState> SyncStateStorage::syncState(const QString & userKey)
{
    const QString filePath = stateFilePath(userKey);

    QFile file{filePath};
    if (!file.exists()) {
        return std::nullopt;
    }

    if (Q_UNLIKELY(!file.open(QIODevice::ReadOnly))) {
        HSWARNING(
            "synchronization::SyncStateStorage",
            "Failed to open sync state file for reading: "
                << filePath << " (" << file.errorString() << ")");
        return std::nullopt;
    }

    const QByteArray contents = file.readAll();
    file.close();

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(contents, &error);
    if (Q_UNLIKELY(doc.isNull() || !doc.isObject())) {
        HSWARNING(
            "synchronization::SyncStateStorage",
            "Failed to parse sync state file, clearing it: "
                << error.errorString());
        clearSyncState(userKey);
        return std::nullopt;
    }

    auto state = deserializeSyncStateFromJson(doc.object());
    if (Q_UNLIKELY(!state)) {
        HSWARNING(
            "synchronization::SyncStateStorage",
            "Failed to deserialize sync state, clearing it");
        clearSyncState(userKey);
        return std::nullopt;
    }

    if (Q_UNLIKELY(state->userKey != userKey)) {
        HSWARNING(
            "synchronization::SyncStateStorage",
            "Sync state belongs to another user: " << state->userKey
                << ", expected " << userKey << "; clearing it");
        clearSyncState(userKey);
        return std::nullopt;
    }

    HSTRACE(
        "synchronization::SyncStateStorage", "Read sync state: " << *state);
    return state;
}

void SyncStateStorage::setSyncState(const SyncState & syncState)
{
    const QString filePath = stateFilePath(syncState.userKey);
    const QDir dir = QFileInfo{filePath}.absoluteDir();
    if (!dir.exists() && Q_UNLIKELY(!dir.mkpath(dir.absolutePath()))) {
        ErrorString error{QT_TRANSLATE_NOOP(
            "synchronization::SyncStateStorage",
            "Failed to create sync state dir")};
        error.details() = dir.absolutePath();
        throw RuntimeError{std::move(error)};
    }

    QSaveFile file{filePath};
    if (Q_UNLIKELY(!file.open(QIODevice::WriteOnly))) {
        ErrorString error{QT_TRANSLATE_NOOP(
            "synchronization::SyncStateStorage",
            "Failed to open sync state file for writing")};
        error.details() = file.errorString();
        throw RuntimeError{std::move(error)};
    }

    const QJsonDocument doc{serializeSyncStateToJson(syncState)};
    const QByteArray contents = doc.toJson(QJsonDocument::Indented);
    if (Q_UNLIKELY(file.write(contents) != contents.size() || !file.commit()))
    {
        ErrorString error{QT_TRANSLATE_NOOP(
            "synchronization::SyncStateStorage",
            "Failed to write sync state file")};
        error.details() = file.errorString();
        throw RuntimeError{std::move(error)};
    }
}

void SyncStateStorage::clearSyncState(const QString & userKey)
{
    const QString filePath = stateFilePath(userKey);
    if (QFile::exists(filePath) && Q_UNLIKELY(!QFile::remove(filePath))) {
        HSWARNING(
            "synchronization::SyncStateStorage",
            "Failed to remove sync state file " << filePath);
    }
}

QString SyncStateStorage::stateFilePath(const QString & userKey) const
{
    return m_rootDir.absoluteFilePath(
        userKey + QStringLiteral("/") + QString::fromUtf8(gStateFileName));
}

} // namespace healthsync::synchronization

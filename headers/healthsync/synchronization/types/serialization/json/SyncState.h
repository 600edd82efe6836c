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

#pragma once

#include <healthsync/synchronization/types/SyncState.h>

#include <QJsonObject>

#include <optional>

namespace healthsync::synchronization {

/**
 * Serialize SyncState to json object, cursors are base64 encoded
 */
[[nodiscard]] QJsonObject HEALTHSYNC_EXPORT
    serializeSyncStateToJson(const SyncState & syncState);

/**
 * Create SyncState from serialized json object.
 * @return SyncState in case of success or std::nullopt in case of
 *         deserialization failure.
 */
[[nodiscard]] std::optional<SyncState> HEALTHSYNC_EXPORT
    deserializeSyncStateFromJson(const QJsonObject & json);

} // namespace healthsync::synchronization

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
#include <healthsync/utility/Linkage.h>

#include <optional>

namespace healthsync::synchronization {

/**
 * @brief The ISyncStateStorage interface represents durable storage of
 * sync sessions' states, one per user.
 */
class HEALTHSYNC_EXPORT ISyncStateStorage
{
public:
    virtual ~ISyncStateStorage() noexcept;

    /**
     * @return sync state stored for the user or std::nullopt if there is
     *         none. Stored state belonging to another user or unreadable
     *         stored state is removed and std::nullopt is returned.
     */
    [[nodiscard]] virtual std::optional<SyncState> syncState(
        const QString & userKey) = 0;

    /**
     * Stores the sync state for the user specified within the state,
     * replacing the previous one atomically.
     *
     * @throw RuntimeError in case of failure to write the state
     */
    virtual void setSyncState(const SyncState & syncState) = 0;

    virtual void clearSyncState(const QString & userKey) = 0;
};

} // namespace healthsync::synchronization

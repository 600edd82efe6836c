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

#include <healthsync/synchronization/Fwd.h>
#include <healthsync/synchronization/types/SyncState.h>

#include <optional>

namespace healthsync::synchronization {

/**
 * @brief The SyncSession class owns the in-memory SyncState of the running
 * sync and writes it to the sync state storage after each change, so that
 * the persisted state always reflects the last acknowledged chunk.
 *
 * Mutating methods throw RuntimeError if the state could not be persisted;
 * the in-memory state is changed regardless.
 */
class SyncSession final
{
public:
    SyncSession(SyncState state, ISyncStateStoragePtr syncStateStorage);

    [[nodiscard]] const SyncState & state() const noexcept;

    [[nodiscard]] TypeProgress progress(const TrackedType & type) const;
    [[nodiscard]] bool isTypeComplete(const TrackedType & type) const;

    void setCurrentTypeIndex(int index);

    void recordDelivered(
        const TrackedType & type, int recordCount,
        const std::optional<Cursor> & cursor);

    void recordRejected(const TrackedType & type, int recordCount);

    void markTypeComplete(const TrackedType & type);

    void persist();

private:
    SyncState m_state;
    const ISyncStateStoragePtr m_syncStateStorage;
};

} // namespace healthsync::synchronization

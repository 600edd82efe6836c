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


#include "SyncSession.h"

#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/synchronization/ISyncStateStorage.h>

namespace healthsync::synchronization {

SyncSession::SyncSession(
    SyncState state, ISyncStateStoragePtr syncStateStorage) :
    m_state{std::move(state)},
    m_syncStateStorage{std::move(syncStateStorage)}
{
    if (Q_UNLIKELY(!m_syncStateStorage)) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("SyncSession ctor: sync state storage is null")}};
    }
}

const SyncState & SyncSession::state() const noexcept
{
    return m_state;
}

TypeProgress SyncSession::progress(const TrackedType & type) const
{
    if (const auto it = m_state.typeProgress.constFind(type);
        it != m_state.typeProgress.constEnd())
    {
        return it.value();
    }

    TypeProgress progress;
    progress.type = type;
    return progress;
}

bool SyncSession::isTypeComplete(const TrackedType & type) const
{
    return m_state.completedTypes.contains(type);
}

void SyncSession::setCurrentTypeIndex(const int index)
{
    if (m_state.currentTypeIndex == index) {
        return;
    }

    m_state.currentTypeIndex = index;
    persist();
}

void SyncSession::recordDelivered(
    const TrackedType & type, const int recordCount,
    const std::optional<Cursor> & cursor)
{
    auto & progress = m_state.progressFor(type);
    progress.sentCount += recordCount;
    if (cursor) {
        progress.pendingCursor = *cursor;
    }

    m_state.totalSentCount += recordCount;
    persist();
}

void SyncSession::recordRejected(
    const TrackedType & type, const int recordCount)
{
    auto & progress = m_state.progressFor(type);
    progress.rejectedCount += recordCount;
    persist();
}

void SyncSession::markTypeComplete(const TrackedType & type)
{
    auto & progress = m_state.progressFor(type);
    if (progress.isComplete && m_state.completedTypes.contains(type)) {
        return;
    }

    progress.isComplete = true;
    m_state.completedTypes.insert(type);
    persist();
}

void SyncSession::persist()
{
    m_syncStateStorage->setSyncState(m_state);
}

} // namespace healthsync::synchronization

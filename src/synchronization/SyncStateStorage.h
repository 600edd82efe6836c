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

#include <healthsync/synchronization/ISyncStateStorage.h>

#include <QDir>

namespace healthsync::synchronization {

/**
 * ISyncStateStorage implementation keeping the state in
 * <root>/<userKey>/state.json
 */
class SyncStateStorage final : public ISyncStateStorage
{
public:
    explicit SyncStateStorage(QDir rootDir);

    [[nodiscard]] std::optional<SyncState> syncState(
        const QString & userKey) override;

    void setSyncState(const SyncState & syncState) override;
    void clearSyncState(const QString & userKey) override;

private:
    [[nodiscard]] QString stateFilePath(const QString & userKey) const;

private:
    const QDir m_rootDir;
};

} // namespace healthsync::synchronization

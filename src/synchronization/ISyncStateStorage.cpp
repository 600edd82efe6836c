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


#include <healthsync/synchronization/ISyncStateStorage.h>

#include "SyncStateStorage.h"

#include <healthsync/synchronization/Factory.h>

#include <QDir>

namespace healthsync::synchronization {

ISyncStateStorage::~ISyncStateStorage() noexcept = default;

ISyncStateStoragePtr createSyncStateStorage(QString storageRootDirPath)
{
    return std::make_shared<SyncStateStorage>(
        QDir{std::move(storageRootDirPath)});
}

} // namespace healthsync::synchronization

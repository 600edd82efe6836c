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
#include <healthsync/synchronization/types/SyncOptions.h>
#include <healthsync/utility/Fwd.h>
#include <healthsync/utility/Linkage.h>

#include <QFuture>

class QNetworkAccessManager;

namespace healthsync::synchronization {

/**
 * Creates the sync engine.
 *
 * @param options               Validated options, see SyncOptionsBuilder
 * @param dataProvider          Source of health records
 * @param credentialsStore      Storage of user's credentials
 * @param networkAccessManager  Network access manager to use, if null, the
 *                              engine creates its own one
 * @throw InvalidArgument if dataProvider or credentialsStore is null
 */
[[nodiscard]] HEALTHSYNC_EXPORT ISyncEnginePtr createSyncEngine(
    SyncOptions options, IDataProviderPtr dataProvider,
    ICredentialsStorePtr credentialsStore,
    QNetworkAccessManager * networkAccessManager = nullptr);

/**
 * Creates credentials store keeping secrets in the keychain and user id with
 * host in QSettings stored within the given ini file. Secrets are read from
 * the keychain asynchronously, the returned future becomes finished once
 * they are loaded.
 *
 * If keychainService is null, the system keychain is used with secrets
 * stored under serviceName.
 *
 * @throw InvalidArgument if settingsFilePath is empty or if keychainService
 *        is null and serviceName is empty
 */
[[nodiscard]] HEALTHSYNC_EXPORT QFuture<ICredentialsStorePtr>
    createKeychainCredentialsStore(
        QString serviceName, QString settingsFilePath,
        utility::IKeychainServicePtr keychainService = nullptr);

[[nodiscard]] HEALTHSYNC_EXPORT ISyncStateStoragePtr
    createSyncStateStorage(QString storageRootDirPath);

} // namespace healthsync::synchronization

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


#include <healthsync/synchronization/Factory.h>

#include "ChunkTransmitter.h"
#include "CursorStorage.h"
#include "KeychainCredentialsStore.h"
#include "NetworkClient.h"
#include "OutboxStorage.h"
#include "SyncEngine.h"
#include "SyncEventsNotifier.h"
#include "SyncOrchestrator.h"
#include "SyncStateStorage.h"
#include "TokenRefreshCoordinator.h"
#include "TypeStreamer.h"

#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/logging/HealthSyncLogger.h>
#include <healthsync/threading/QtFutureContinuations.h>
#include <healthsync/utility/Factory.h>

#include <QDir>
#include <QPromise>

namespace healthsync::synchronization {

ISyncEnginePtr createSyncEngine(
    SyncOptions options, IDataProviderPtr dataProvider,
    ICredentialsStorePtr credentialsStore,
    QNetworkAccessManager * networkAccessManager)
{
    if (Q_UNLIKELY(!dataProvider)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "Cannot create sync engine: data provider is null")}};
    }

    if (Q_UNLIKELY(!credentialsStore)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "Cannot create sync engine: credentials store is null")}};
    }

    HSDEBUG(
        "synchronization::Factory", "Creating sync engine with " << options);

    const QDir rootDir{options.storageRootDirPath};
    if (!rootDir.exists() &&
        Q_UNLIKELY(!rootDir.mkpath(rootDir.absolutePath())))
    {
        ErrorString error{QT_TRANSLATE_NOOP(
            "synchronization::Factory",
            "Cannot create sync engine: failed to create storage dir")};
        error.details() = rootDir.absolutePath();
        throw InvalidArgument{std::move(error)};
    }

    auto networkClient = std::make_shared<NetworkClient>(
        networkAccessManager, options.requestTimeout);

    auto syncStateStorage = std::make_shared<SyncStateStorage>(rootDir);
    auto cursorStorage = std::make_shared<CursorStorage>(rootDir);
    auto outboxStorage = std::make_shared<OutboxStorage>(rootDir);

    auto tokenRefreshCoordinator = std::make_shared<TokenRefreshCoordinator>(
        credentialsStore, networkClient, options.refreshPath);

    auto chunkTransmitter = std::make_shared<ChunkTransmitter>(
        outboxStorage, cursorStorage, networkClient,
        std::move(tokenRefreshCoordinator), credentialsStore,
        options.syncPathTemplate, options.apiKeyHeaderName);

    auto notifier = std::make_unique<SyncEventsNotifier>();

    auto typeStreamer = std::make_shared<TypeStreamer>(
        std::move(dataProvider), chunkTransmitter, cursorStorage,
        notifier.get());

    auto orchestrator = std::make_shared<SyncOrchestrator>(
        options, credentialsStore, std::move(syncStateStorage),
        std::move(cursorStorage), std::move(outboxStorage),
        std::move(typeStreamer), std::move(networkClient), notifier.get());

    return std::make_shared<SyncEngine>(
        std::move(options), std::move(credentialsStore),
        std::move(orchestrator), std::move(chunkTransmitter),
        std::move(notifier));
}

QFuture<ICredentialsStorePtr> createKeychainCredentialsStore(
    QString serviceName, QString settingsFilePath,
    utility::IKeychainServicePtr keychainService)
{
    if (!keychainService) {
        keychainService = utility::newQtKeychainService(std::move(serviceName));
    }

    auto store = std::make_shared<KeychainCredentialsStore>(
        std::move(keychainService), std::move(settingsFilePath));

    auto promise = std::make_shared<QPromise<ICredentialsStorePtr>>();
    auto future = promise->future();
    promise->start();

    auto restoreFuture = store->restore();

    threading::thenOrFailed(
        std::move(restoreFuture), promise,
        [promise, store = std::move(store)]() mutable {
            promise->addResult(ICredentialsStorePtr{std::move(store)});
            promise->finish();
        });

    return future;
}

} // namespace healthsync::synchronization

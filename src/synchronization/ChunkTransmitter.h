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

#include "Fwd.h"
#include "IChunkTransmitter.h"
#include "IOutboxStorage.h"

#include <healthsync/synchronization/Fwd.h>
#include <healthsync/synchronization/types/Credentials.h>

#include <memory>

template <class T>
class QPromise;

namespace healthsync::synchronization {

struct NetworkRequest;
struct NetworkResponse;

class ChunkTransmitter final :
    public IChunkTransmitter,
    public std::enable_shared_from_this<ChunkTransmitter>
{
public:
    ChunkTransmitter(
        IOutboxStoragePtr outboxStorage, ICursorStoragePtr cursorStorage,
        INetworkClientPtr networkClient,
        ITokenRefreshCoordinatorPtr tokenRefreshCoordinator,
        ICredentialsStorePtr credentialsStore, QString syncPathTemplate,
        QString apiKeyHeaderName);

    [[nodiscard]] QFuture<TransmitResult> send(
        Chunk chunk, utility::cancelers::ICancelerPtr canceler) override;

    [[nodiscard]] QFuture<SweepResult> retryPendingItems(
        std::chrono::milliseconds minAge) override;

private:
    struct SweepContext
    {
        QList<OutboxItem> items;
        int index = 0;
        SweepResult result;
        std::shared_ptr<QPromise<SweepResult>> promise;
    };

    using SweepContextPtr = std::shared_ptr<SweepContext>;

    [[nodiscard]] QFuture<TransmitResult> deliver(
        OutboxItem item, Credentials credentials, bool tokenRefreshed);

    void onResponse(
        OutboxItem item, const Credentials & credentials, bool tokenRefreshed,
        const NetworkResponse & response,
        const std::shared_ptr<QPromise<TransmitResult>> & promise);

    void onUnauthorized(
        OutboxItem item, const Credentials & credentials,
        bool tokenRefreshed,
        const std::shared_ptr<QPromise<TransmitResult>> & promise);

    /**
     * Commits cursors of the acknowledged item and removes it from the
     * outbox; repeated reconciliation of the same item is a no-op.
     */
    void reconcile(const OutboxItem & item);

    [[nodiscard]] NetworkRequest createRequest(
        const OutboxItem & item, const Credentials & credentials) const;

    void retryNextPendingItem(const SweepContextPtr & context);
    void finishSweep(const SweepContextPtr & context);

private:
    const IOutboxStoragePtr m_outboxStorage;
    const ICursorStoragePtr m_cursorStorage;
    const INetworkClientPtr m_networkClient;
    const ITokenRefreshCoordinatorPtr m_tokenRefreshCoordinator;
    const ICredentialsStorePtr m_credentialsStore;
    const QString m_syncPathTemplate;
    const QString m_apiKeyHeaderName;

    std::optional<QFuture<SweepResult>> m_pendingSweep;
};

} // namespace healthsync::synchronization

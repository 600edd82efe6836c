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
#include "ITokenRefreshCoordinator.h"

#include <healthsync/synchronization/Fwd.h>

#include <QMutex>

#include <memory>
#include <optional>

template <class T>
class QPromise;

namespace healthsync::synchronization {

struct NetworkResponse;

class TokenRefreshCoordinator final :
    public ITokenRefreshCoordinator,
    public std::enable_shared_from_this<TokenRefreshCoordinator>
{
public:
    TokenRefreshCoordinator(
        ICredentialsStorePtr credentialsStore,
        INetworkClientPtr networkClient, QString refreshPath);

    [[nodiscard]] QFuture<TokenRefreshResult> refresh() override;

private:
    void onRefreshResponse(
        const NetworkResponse & response,
        const std::shared_ptr<QPromise<TokenRefreshResult>> & promise);

    void finishRefresh(
        TokenRefreshResult result,
        const std::shared_ptr<QPromise<TokenRefreshResult>> & promise);

private:
    const ICredentialsStorePtr m_credentialsStore;
    const INetworkClientPtr m_networkClient;
    const QString m_refreshPath;

    QMutex m_pendingRefreshMutex;
    std::optional<QFuture<TokenRefreshResult>> m_pendingRefresh;
};

} // namespace healthsync::synchronization

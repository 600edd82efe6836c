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

#include <QFuture>
#include <QTextStream>

namespace healthsync::synchronization {

enum class TokenRefreshResult
{
    Refreshed,
    /**
     * No refresh token, rejected or malformed response, network failure
     */
    Failed,
    /**
     * The refresh request was aborted, i.e. because sync was canceled
     */
    Aborted
};

QTextStream & operator<<(QTextStream & strm, TokenRefreshResult result);

/**
 * @brief The ITokenRefreshCoordinator interface refreshes the access token
 * using the stored refresh token. At most one refresh request is in flight at
 * any time: callers requesting refresh while it is running get the future of
 * the running refresh.
 */
class ITokenRefreshCoordinator
{
public:
    virtual ~ITokenRefreshCoordinator() = default;

    /**
     * @return future with Refreshed if new tokens were obtained and stored.
     *         The future never contains exception.
     */
    [[nodiscard]] virtual QFuture<TokenRefreshResult> refresh() = 0;
};

} // namespace healthsync::synchronization

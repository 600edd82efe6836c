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

#include <healthsync/synchronization/types/Credentials.h>
#include <healthsync/utility/Linkage.h>

#include <optional>

namespace healthsync::synchronization {

/**
 * @brief The ICredentialsStore interface provides synchronous access to
 * user's credentials. Methods can be called from any thread.
 */
class HEALTHSYNC_EXPORT ICredentialsStore
{
public:
    virtual ~ICredentialsStore() noexcept;

    [[nodiscard]] virtual std::optional<Credentials> credentials() const = 0;

    virtual void setCredentials(Credentials credentials) = 0;

    /**
     * Replaces access token and, if passed, refresh token of stored
     * credentials; does nothing if there are no stored credentials
     */
    virtual void updateTokens(
        QString accessToken, std::optional<QString> refreshToken) = 0;

    virtual void clear() = 0;
};

} // namespace healthsync::synchronization

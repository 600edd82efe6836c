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

#include <healthsync/utility/Linkage.h>
#include <healthsync/utility/Printable.h>

#include <QString>

#include <optional>

namespace healthsync::synchronization {

/**
 * @brief User's credentials for the remote collection endpoint: either
 * a pair of access and refresh tokens or an API key.
 */
struct HEALTHSYNC_EXPORT Credentials : public Printable
{
    /**
     * @return true if API key is used for authorization instead of tokens
     */
    [[nodiscard]] bool isApiKeyAuth() const noexcept;

    /**
     * @return true if there is user id and either access token or API key
     */
    [[nodiscard]] bool isValid() const noexcept;

    /**
     * Prints credentials with secrets masked
     */
    QTextStream & print(QTextStream & strm) const override;

    QString userId;
    std::optional<QString> accessToken;
    std::optional<QString> refreshToken;
    std::optional<QString> apiKey;

    /**
     * Base URL of the server, i.e. https://api.example.com
     */
    QString host;
};

[[nodiscard]] HEALTHSYNC_EXPORT bool operator==(
    const Credentials & lhs, const Credentials & rhs) noexcept;

[[nodiscard]] HEALTHSYNC_EXPORT bool operator!=(
    const Credentials & lhs, const Credentials & rhs) noexcept;

} // namespace healthsync::synchronization

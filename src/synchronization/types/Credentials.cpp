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

#include <healthsync/synchronization/types/Credentials.h>

namespace healthsync::synchronization {

namespace {

[[nodiscard]] QString maskedSecret(const std::optional<QString> & secret)
{
    if (!secret) {
        return QStringLiteral("<none>");
    }

    if (secret->size() <= 4) {
        return QStringLiteral("****");
    }

    return QStringLiteral("****") + secret->right(4);
}

} // namespace

bool Credentials::isApiKeyAuth() const noexcept
{
    return apiKey.has_value() && !accessToken.has_value();
}

bool Credentials::isValid() const noexcept
{
    if (userId.isEmpty()) {
        return false;
    }

    return (accessToken && !accessToken->isEmpty()) ||
        (apiKey && !apiKey->isEmpty());
}

QTextStream & Credentials::print(QTextStream & strm) const
{
    strm << "Credentials: user id = " << userId << ", host = " << host
         << ", access token = " << maskedSecret(accessToken)
         << ", refresh token = " << maskedSecret(refreshToken)
         << ", api key = " << maskedSecret(apiKey);
    return strm;
}

bool operator==(const Credentials & lhs, const Credentials & rhs) noexcept
{
    return lhs.userId == rhs.userId && lhs.accessToken == rhs.accessToken &&
        lhs.refreshToken == rhs.refreshToken && lhs.apiKey == rhs.apiKey &&
        lhs.host == rhs.host;
}

bool operator!=(const Credentials & lhs, const Credentials & rhs) noexcept
{
    return !(lhs == rhs);
}

} // namespace healthsync::synchronization

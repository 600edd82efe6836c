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

#include <healthsync/synchronization/types/Fwd.h>
#include <healthsync/synchronization/types/TypeAliases.h>

#include <QByteArray>
#include <QString>

#include <string_view>

namespace healthsync::synchronization {

/**
 * Key under which persistent data of the user is stored:
 * "user.<userId>" or "user.none" if user id is empty
 */
[[nodiscard]] QString userKey(const QString & userId);

/**
 * Type identifier without platform specific prefixes, for logging
 */
[[nodiscard]] QString shortTypeName(const TrackedType & type);

/**
 * Server response body suitable for logging: at most 200 characters
 */
[[nodiscard]] QString truncatedResponseBody(const QByteArray & body);

/**
 * Value of Authorization header for access token, adds "Bearer " prefix
 * unless the token already has it
 */
[[nodiscard]] QByteArray bearerAuthorizationHeaderValue(
    const QString & accessToken);

/**
 * Joins host and path ensuring there's exactly one slash between them
 */
[[nodiscard]] QString joinUrl(QString host, const QString & path);

[[nodiscard]] QString toString(std::string_view str);

} // namespace healthsync::synchronization

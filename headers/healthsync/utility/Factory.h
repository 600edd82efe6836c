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

#include <healthsync/utility/Fwd.h>
#include <healthsync/utility/Linkage.h>

#include <QString>

namespace healthsync::utility {

/**
 * Creates keychain service backed by the system keychain; all secrets go
 * under the given service name.
 *
 * @throw InvalidArgument if serviceName is empty
 */
[[nodiscard]] HEALTHSYNC_EXPORT IKeychainServicePtr
    newQtKeychainService(QString serviceName);

} // namespace healthsync::utility

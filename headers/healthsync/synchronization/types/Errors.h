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

#include <healthsync/exception/RuntimeError.h>

namespace healthsync::synchronization {

/**
 * @brief The DataUnavailableError exception is put by the data provider into
 * the query future when health data is temporarily inaccessible, for example
 * while the device is locked. Sync is paused and resumed once data becomes
 * available again.
 */
class HEALTHSYNC_EXPORT DataUnavailableError : public RuntimeError
{
public:
    explicit DataUnavailableError(ErrorString message);

    [[nodiscard]] DataUnavailableError * clone() const override;
    void raise() const override;

protected:
    [[nodiscard]] QString exceptionDisplayName() const override;
};

} // namespace healthsync::synchronization

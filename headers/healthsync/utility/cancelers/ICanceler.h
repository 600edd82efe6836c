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

namespace healthsync::utility::cancelers {

/**
 * @brief The ICanceler interface is polled by long running asynchronous
 * operations between their steps: once it reports cancellation, the
 * operation doesn't start the next step and finishes as canceled.
 *
 * Implementations must be safe to poll from any thread.
 */
class HEALTHSYNC_EXPORT ICanceler
{
public:
    virtual ~ICanceler() = default;

    [[nodiscard]] virtual bool isCanceled() const = 0;
};

} // namespace healthsync::utility::cancelers

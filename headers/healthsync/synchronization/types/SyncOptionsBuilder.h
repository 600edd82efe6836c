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

#include <healthsync/synchronization/types/SyncOptions.h>

namespace healthsync::synchronization {

class HEALTHSYNC_EXPORT SyncOptionsBuilder
{
public:
    SyncOptionsBuilder & setTrackedTypes(QList<TrackedType> types);
    SyncOptionsBuilder & setForegroundChunkSize(int size);
    SyncOptionsBuilder & setBackgroundChunkSize(int size);

    SyncOptionsBuilder & setDebounceInterval(
        std::chrono::milliseconds interval);

    SyncOptionsBuilder & setNetworkSettleDelay(std::chrono::milliseconds delay);

    SyncOptionsBuilder & setAvailabilityResumeDelay(
        std::chrono::milliseconds delay);

    SyncOptionsBuilder & setOutboxRetryMinAge(std::chrono::milliseconds age);

    SyncOptionsBuilder & setOutboxSweepInterval(
        std::chrono::milliseconds interval);

    SyncOptionsBuilder & setRequestTimeout(std::chrono::milliseconds timeout);
    SyncOptionsBuilder & setStorageRootDirPath(QString path);
    SyncOptionsBuilder & setSyncPathTemplate(QString pathTemplate);
    SyncOptionsBuilder & setRefreshPath(QString path);
    SyncOptionsBuilder & setApiKeyHeaderName(QString name);

    /**
     * Validates the accumulated values and creates options from them,
     * the builder is reset to defaults afterwards.
     *
     * @throw InvalidArgument if some value is invalid
     */
    [[nodiscard]] SyncOptions build();

private:
    SyncOptions m_options;
};

} // namespace healthsync::synchronization

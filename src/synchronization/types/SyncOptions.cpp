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

#include <healthsync/synchronization/types/SyncOptions.h>

namespace healthsync::synchronization {

QTextStream & SyncOptions::print(QTextStream & strm) const
{
    strm << "SyncOptions: tracked types = "
         << trackedTypes.join(QStringLiteral(", "))
         << ", foreground chunk size = " << foregroundChunkSize
         << ", background chunk size = " << backgroundChunkSize
         << ", debounce interval = " << debounceInterval.count() << " ms"
         << ", network settle delay = " << networkSettleDelay.count() << " ms"
         << ", availability resume delay = "
         << availabilityResumeDelay.count() << " ms"
         << ", outbox retry min age = " << outboxRetryMinAge.count() << " ms"
         << ", outbox sweep interval = " << outboxSweepInterval.count()
         << " ms, request timeout = " << requestTimeout.count()
         << " ms, storage root dir = " << storageRootDirPath
         << ", sync path template = " << syncPathTemplate
         << ", refresh path = " << refreshPath
         << ", api key header = " << apiKeyHeaderName;
    return strm;
}

bool operator==(const SyncOptions & lhs, const SyncOptions & rhs) noexcept
{
    return lhs.trackedTypes == rhs.trackedTypes &&
        lhs.foregroundChunkSize == rhs.foregroundChunkSize &&
        lhs.backgroundChunkSize == rhs.backgroundChunkSize &&
        lhs.debounceInterval == rhs.debounceInterval &&
        lhs.networkSettleDelay == rhs.networkSettleDelay &&
        lhs.availabilityResumeDelay == rhs.availabilityResumeDelay &&
        lhs.outboxRetryMinAge == rhs.outboxRetryMinAge &&
        lhs.outboxSweepInterval == rhs.outboxSweepInterval &&
        lhs.requestTimeout == rhs.requestTimeout &&
        lhs.storageRootDirPath == rhs.storageRootDirPath &&
        lhs.syncPathTemplate == rhs.syncPathTemplate &&
        lhs.refreshPath == rhs.refreshPath &&
        lhs.apiKeyHeaderName == rhs.apiKeyHeaderName;
}

bool operator!=(const SyncOptions & lhs, const SyncOptions & rhs) noexcept
{
    return !(lhs == rhs);
}

} // namespace healthsync::synchronization

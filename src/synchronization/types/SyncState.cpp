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

#include <healthsync/synchronization/types/SyncState.h>

namespace healthsync::synchronization {

bool SyncState::hasProgress() const noexcept
{
    return totalSentCount > 0 || !completedTypes.isEmpty();
}

TypeProgress & SyncState::progressFor(const TrackedType & type)
{
    auto it = typeProgress.find(type);
    if (it == typeProgress.end()) {
        TypeProgress progress;
        progress.type = type;
        it = typeProgress.insert(type, std::move(progress));
    }
    return it.value();
}

QTextStream & SyncState::print(QTextStream & strm) const
{
    strm << "SyncState: user key = " << userKey
         << ", full export = " << (fullExport ? "true" : "false")
         << ", created at = " << createdAt.toString(Qt::ISODateWithMs)
         << ", total sent count = " << totalSentCount
         << ", current type index = " << currentTypeIndex
         << ", completed types: ";

    if (completedTypes.isEmpty()) {
        strm << "<none>";
    }
    else {
        strm << QStringList{completedTypes.begin(), completedTypes.end()}.join(
            QStringLiteral(", "));
    }

    strm << "; type progress:\n";
    for (const auto & progress: std::as_const(typeProgress)) {
        strm << "    " << progress << "\n";
    }

    return strm;
}

bool operator==(const SyncState & lhs, const SyncState & rhs) noexcept
{
    return lhs.userKey == rhs.userKey && lhs.fullExport == rhs.fullExport &&
        lhs.createdAt == rhs.createdAt &&
        lhs.typeProgress == rhs.typeProgress &&
        lhs.totalSentCount == rhs.totalSentCount &&
        lhs.completedTypes == rhs.completedTypes &&
        lhs.currentTypeIndex == rhs.currentTypeIndex;
}

bool operator!=(const SyncState & lhs, const SyncState & rhs) noexcept
{
    return !(lhs == rhs);
}

} // namespace healthsync::synchronization

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

#include <healthsync/synchronization/types/TypeProgress.h>

namespace healthsync::synchronization {

QTextStream & TypeProgress::print(QTextStream & strm) const
{
    strm << "TypeProgress: type = " << type << ", sent count = " << sentCount
         << ", rejected count = " << rejectedCount
         << ", is complete = " << (isComplete ? "true" : "false")
         << ", pending cursor = "
         << (pendingCursor ? QString::fromUtf8(pendingCursor->toBase64())
                           : QStringLiteral("<none>"));
    return strm;
}

bool operator==(const TypeProgress & lhs, const TypeProgress & rhs) noexcept
{
    return lhs.type == rhs.type && lhs.sentCount == rhs.sentCount &&
        lhs.rejectedCount == rhs.rejectedCount &&
        lhs.isComplete == rhs.isComplete &&
        lhs.pendingCursor == rhs.pendingCursor;
}

bool operator!=(const TypeProgress & lhs, const TypeProgress & rhs) noexcept
{
    return !(lhs == rhs);
}

} // namespace healthsync::synchronization

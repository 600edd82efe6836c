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

#include <healthsync/synchronization/types/TypeAliases.h>
#include <healthsync/utility/Linkage.h>
#include <healthsync/utility/Printable.h>

#include <QtGlobal>

#include <optional>

namespace healthsync::synchronization {

/**
 * @brief Progress of a single tracked type within the current sync session
 */
struct HEALTHSYNC_EXPORT TypeProgress : public Printable
{
    QTextStream & print(QTextStream & strm) const override;

    TrackedType type;

    /**
     * Number of records acknowledged by the server
     */
    qint64 sentCount = 0;

    /**
     * Number of records in chunks permanently rejected by the server
     */
    qint64 rejectedCount = 0;

    bool isComplete = false;

    /**
     * Cursor of the last acknowledged chunk of this type within the session;
     * the next provider query for this type continues from it
     */
    std::optional<Cursor> pendingCursor;
};

[[nodiscard]] HEALTHSYNC_EXPORT bool operator==(
    const TypeProgress & lhs, const TypeProgress & rhs) noexcept;

[[nodiscard]] HEALTHSYNC_EXPORT bool operator!=(
    const TypeProgress & lhs, const TypeProgress & rhs) noexcept;

} // namespace healthsync::synchronization

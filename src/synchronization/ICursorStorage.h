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

#include <QtGlobal>

#include <optional>

namespace healthsync::synchronization {

/**
 * @brief The ICursorStorage interface stores cursors of tracked types
 * committed after the server acknowledged the corresponding chunks, plus
 * the flag telling whether the first full export of the user has completed.
 */
class ICursorStorage
{
public:
    virtual ~ICursorStorage() = default;

    [[nodiscard]] virtual std::optional<Cursor> cursor(
        const QString & userKey, const TrackedType & type) const = 0;

    /**
     * Commits the cursor produced by the outbox item with the given
     * sequence number. If the cursor of this type was already committed
     * from an item with greater sequence number, nothing is changed, so
     * cursors never move backwards when old outbox items are delivered
     * late.
     *
     * @return true if the cursor was committed, false if it was ignored
     * @throw RuntimeError if the cursor could not be persisted
     */
    virtual bool commitCursor(
        const QString & userKey, const TrackedType & type,
        const Cursor & cursor, qint64 sequence) = 0;

    [[nodiscard]] virtual bool isFullExportDone(
        const QString & userKey) const = 0;

    /**
     * @throw RuntimeError if the flag could not be persisted
     */
    virtual void setFullExportDone(const QString & userKey, bool done) = 0;

    /**
     * Removes all cursors and the full export flag of the user
     */
    virtual void clear(const QString & userKey) = 0;
};

} // namespace healthsync::synchronization

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

#include <healthsync/synchronization/types/DataBatch.h>
#include <healthsync/utility/Linkage.h>

#include <QFuture>

#include <optional>

namespace healthsync::synchronization {

/**
 * @brief The IDataProvider interface represents the source of health records:
 * a cursor based change feed per tracked type.
 */
class HEALTHSYNC_EXPORT IDataProvider
{
public:
    virtual ~IDataProvider() noexcept;

    /**
     * Reads the next batch of records of the given type.
     *
     * @param type              Type of records to read
     * @param cursor            Cursor returned along with the previously
     *                          read batch; if absent, reading starts from
     *                          the beginning of the history
     * @param limit             Max number of records in the batch
     * @return                  Future with the batch; empty records list
     *                          means there are no more records of this type.
     *                          If health data is temporarily inaccessible,
     *                          the future contains DataUnavailableError,
     *                          any other exception is treated as
     *                          unrecoverable error of this type.
     */
    [[nodiscard]] virtual QFuture<DataBatch> query(
        TrackedType type, std::optional<Cursor> cursor, int limit) = 0;
};

} // namespace healthsync::synchronization

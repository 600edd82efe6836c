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

#include "Fwd.h"

#include <healthsync/synchronization/Fwd.h>
#include <healthsync/synchronization/types/TypeAliases.h>
#include <healthsync/utility/Fwd.h>

#include <QFuture>
#include <QTextStream>

#include <optional>

namespace healthsync::synchronization {

enum class TypeStreamStatus
{
    /**
     * All records of the type were read and delivered or rejected
     */
    Completed,
    /**
     * The data provider failed for this type, the type was marked complete
     * without its remaining records
     */
    Skipped,
    Canceled,
    NetworkFailure,
    /**
     * Health data became temporarily inaccessible
     */
    DataUnavailable,
    AuthenticationFailure,
    BudgetExhausted,
    StorageFailure
};

QTextStream & operator<<(QTextStream & strm, TypeStreamStatus status);

struct TypeStreamRequest
{
    TrackedType type;

    /**
     * Cursor to start reading from, absent to read the whole history
     */
    std::optional<Cursor> startCursor;

    int chunkSize = 0;
    bool fullExport = false;

    SyncSessionPtr session;
    IExecutionBudgetPtr budget;
    utility::cancelers::ICancelerPtr canceler;
};

/**
 * @brief The ITypeStreamer interface drains all outstanding records of one
 * tracked type: reads them from the data provider chunk by chunk and hands
 * each chunk to the transmitter, strictly sequentially.
 */
class ITypeStreamer
{
public:
    virtual ~ITypeStreamer() = default;

    /**
     * @return future with the status of the type; the future never contains
     *         exception
     */
    [[nodiscard]] virtual QFuture<TypeStreamStatus> stream(
        TypeStreamRequest request) = 0;
};

} // namespace healthsync::synchronization

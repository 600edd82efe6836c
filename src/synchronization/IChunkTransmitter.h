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
#include <healthsync/utility/Printable.h>
#include <healthsync/utility/Fwd.h>

#include <QFuture>
#include <QList>

#include <chrono>
#include <optional>

namespace healthsync::synchronization {

/**
 * @brief Records of one tracked type sent to the server together
 */
struct Chunk
{
    TrackedType type;
    QList<DataRecord> records;

    /**
     * Cursor to commit once the server acknowledges the chunk
     */
    std::optional<Cursor> cursor;

    bool fullExport = false;
};

struct TransmitResult : public Printable
{
    enum class Status
    {
        /**
         * Server acknowledged the chunk, the cursor is committed
         */
        Delivered,
        /**
         * Server permanently rejected the chunk (4xx other than 401), the
         * chunk is dropped
         */
        Rejected,
        /**
         * No response or 5xx, the chunk stays in the outbox
         */
        NetworkFailure,
        /**
         * 401 which could not be resolved by token refresh or missing
         * credentials
         */
        AuthenticationFailure,
        StorageFailure,
        Canceled
    };

    QTextStream & print(QTextStream & strm) const override;

    Status status = Status::Delivered;

    /**
     * HTTP status of the last response, zero if there was none
     */
    int httpStatus = 0;
};

QTextStream & operator<<(QTextStream & strm, TransmitResult::Status status);

struct SweepResult : public Printable
{
    QTextStream & print(QTextStream & strm) const override;

    int deliveredCount = 0;

    /**
     * The sweep stopped because an item got no response or 5xx
     */
    bool networkFailure = false;
};

/**
 * @brief The IChunkTransmitter interface delivers chunks to the server
 * through the durable outbox: each chunk is staged before the upload and the
 * chunk's cursor is committed only after the server acknowledges it.
 */
class IChunkTransmitter
{
public:
    virtual ~IChunkTransmitter() = default;

    /**
     * Stages the chunk in the outbox and uploads it.
     *
     * @param chunk         Chunk to send
     * @param canceler      Canceler checked before the upload starts
     * @return              Future with the result; the future never contains
     *                      exception
     */
    [[nodiscard]] virtual QFuture<TransmitResult> send(
        Chunk chunk, utility::cancelers::ICancelerPtr canceler) = 0;

    /**
     * Re-sends outbox items of the current user staged earlier than
     * minAge ago, one by one. Items of other users are removed.
     *
     * @return future with the number of delivered items and whether the
     *         sweep ran into a network failure
     */
    [[nodiscard]] virtual QFuture<SweepResult> retryPendingItems(
        std::chrono::milliseconds minAge) = 0;
};

} // namespace healthsync::synchronization

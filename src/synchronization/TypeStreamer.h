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

#include "IChunkTransmitter.h"
#include "ITypeStreamer.h"
#include "SyncEventsNotifier.h"

#include <QPointer>

#include <memory>

class QException;

template <class T>
class QPromise;

namespace healthsync::synchronization {

class TypeStreamer final :
    public ITypeStreamer,
    public std::enable_shared_from_this<TypeStreamer>
{
public:
    TypeStreamer(
        IDataProviderPtr dataProvider, IChunkTransmitterPtr chunkTransmitter,
        ICursorStoragePtr cursorStorage, SyncEventsNotifier * notifier);

    [[nodiscard]] QFuture<TypeStreamStatus> stream(
        TypeStreamRequest request) override;

private:
    enum class Step
    {
        Query,
        Transmit,
        Finish
    };

    struct Context
    {
        TypeStreamRequest request;
        std::shared_ptr<QPromise<TypeStreamStatus>> promise;

        Step nextStep = Step::Query;
        TypeStreamStatus status = TypeStreamStatus::Completed;

        /**
         * Cursor the next query continues from
         */
        std::optional<Cursor> cursor;

        /**
         * Chunk read by the last query and not yet transmitted
         */
        Chunk chunk;
        bool isLastChunk = false;

        int chunkIndex = 0;
    };

    using ContextPtr = std::shared_ptr<Context>;

    void scheduleStep(const ContextPtr & context, Step step);
    void runStep(const ContextPtr & context);

    void queryBatch(const ContextPtr & context);
    void onBatch(const ContextPtr & context, DataBatch batch);
    void onQueryFailed(const ContextPtr & context, const QException * e);

    void transmitChunk(const ContextPtr & context);

    void onTransmitResult(
        const ContextPtr & context, const TransmitResult & result);

    void completeType(const ContextPtr & context, TypeStreamStatus status);
    void finish(const ContextPtr & context, TypeStreamStatus status);

private:
    const IDataProviderPtr m_dataProvider;
    const IChunkTransmitterPtr m_chunkTransmitter;
    const ICursorStoragePtr m_cursorStorage;
    const QPointer<SyncEventsNotifier> m_notifier;
};

} // namespace healthsync::synchronization

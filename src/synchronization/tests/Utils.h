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

#include <healthsync/synchronization/types/Credentials.h>
#include <healthsync/synchronization/types/DataBatch.h>

#include <synchronization/IChunkTransmitter.h>
#include <synchronization/INetworkClient.h>

#include <QEventLoop>
#include <QFuture>
#include <QFutureWatcher>
#include <QTimer>

#include <chrono>

namespace healthsync::synchronization::tests {

/**
 * Spins the event loop until the future is finished or the timeout expires
 */
template <class T>
void waitForFuture(
    const QFuture<T> & future,
    const std::chrono::milliseconds timeout = std::chrono::seconds{10})
{
    if (future.isFinished()) {
        return;
    }

    QEventLoop loop;
    QFutureWatcher<T> watcher;
    QObject::connect(
        &watcher, &QFutureWatcher<T>::finished, &loop, &QEventLoop::quit);

    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);

    watcher.setFuture(future);
    timer.start(timeout);
    loop.exec();
}

/**
 * Processes events for the given time, for tests of timer driven behaviour
 */
void spinEventLoop(std::chrono::milliseconds duration);

[[nodiscard]] Credentials tokenCredentials(
    QString userId = QStringLiteral("user-1"));

[[nodiscard]] Credentials apiKeyCredentials(
    QString userId = QStringLiteral("user-1"));

/**
 * Batch of the given number of records of the given kind
 */
[[nodiscard]] DataBatch makeBatch(
    int recordCount, std::optional<Cursor> newCursor,
    RecordKind kind = RecordKind::Record);

[[nodiscard]] NetworkResponse httpResponse(
    int statusCode, QByteArray body = {});

[[nodiscard]] NetworkResponse noResponse(QString errorString);

[[nodiscard]] NetworkResponse abortedResponse();

[[nodiscard]] SweepResult sweepResult(
    int deliveredCount, bool networkFailure = false);

} // namespace healthsync::synchronization::tests

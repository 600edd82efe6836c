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

#include <healthsync/utility/Linkage.h>

#include <QException>
#include <QFuture>
#include <QPromise>

#include <exception>
#include <type_traits>
#include <utility>

namespace healthsync::threading {

namespace detail {

// Runs fill on the started promise and returns the finished future
template <class T, class Fill>
[[nodiscard]] QFuture<T> finishedFuture(Fill && fill)
{
    QPromise<T> promise;
    auto future = promise.future();

    promise.start();
    std::forward<Fill>(fill)(promise);
    promise.finish();

    return future;
}

} // namespace detail

/**
 * Future which is already finished and holds the given value
 */
template <class T>
[[nodiscard]] std::enable_if_t<
    !std::is_void_v<std::decay_t<T>>, QFuture<std::decay_t<T>>>
    makeReadyFuture(T value)
{
    return detail::finishedFuture<std::decay_t<T>>(
        [&value](QPromise<std::decay_t<T>> & promise) {
            promise.addResult(std::move(value));
        });
}

[[nodiscard]] HEALTHSYNC_EXPORT QFuture<void> makeReadyFuture();

/**
 * Future which is already finished with the given exception, waiting for
 * its result rethrows the exception
 */
template <class T, class E>
[[nodiscard]] std::enable_if_t<std::is_base_of_v<QException, E>, QFuture<T>>
    makeExceptionalFuture(const E & e)
{
    return detail::finishedFuture<T>(
        [&e](QPromise<T> & promise) { promise.setException(e); });
}

template <class T>
[[nodiscard]] QFuture<T> makeExceptionalFuture(std::exception_ptr e)
{
    return detail::finishedFuture<T>([&e](QPromise<T> & promise) {
        promise.setException(std::move(e));
    });
}

} // namespace healthsync::threading

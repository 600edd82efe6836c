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

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace healthsync::threading {

/**
 * Wrapper for callbacks of asynchronous operations which invokes the wrapped
 * function only if the tracked object is still alive by the time the callback
 * gets called. With this class code like this
 *
 * auto task = [selfWeak = weak_from_this()] {
 *     auto self = selfWeak.lock();
 *     if (!self) {
 *         return;
 *     }
 *     // otherwise do something
 * };
 *
 * can be written like this:
 *
 * auto task = threading::TrackedTask{weak_from_this(), [this] { ... }};
 */
template <typename T, typename Function>
class TrackedTask
{
public:
    TrackedTask(std::weak_ptr<T> tracked, Function function) :
        m_tracked{std::move(tracked)}, m_function{std::move(function)}
    {}

    template <
        typename... Arguments,
        typename = std::enable_if_t<std::is_invocable_v<Function, Arguments...>>>
    void operator()(Arguments &&... arguments)
    {
        if (const auto lockedObject = m_tracked.lock()) {
            std::invoke(m_function, std::forward<Arguments>(arguments)...);
        }
    }

    template <
        typename... Arguments,
        typename = std::enable_if_t<
            std::is_invocable_v<const Function, Arguments...>>>
    void operator()(Arguments &&... arguments) const
    {
        if (const auto lockedObject = m_tracked.lock()) {
            std::invoke(m_function, std::forward<Arguments>(arguments)...);
        }
    }

private:
    std::weak_ptr<T> m_tracked;
    Function m_function;
};

template <typename T, typename Function>
TrackedTask(std::weak_ptr<T>, Function) -> TrackedTask<T, Function>;

} // namespace healthsync::threading

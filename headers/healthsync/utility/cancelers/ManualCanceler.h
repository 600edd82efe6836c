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

#include <healthsync/utility/cancelers/ICanceler.h>

#include <atomic>

namespace healthsync::utility::cancelers {

/**
 * ICanceler which allows one to manually call cancel method to cancel
 * some task. Once canceled, it stays canceled: a fresh canceler is meant
 * to be created for each new task.
 */
class HEALTHSYNC_EXPORT ManualCanceler final : public ICanceler
{
public:
    void cancel() noexcept
    {
        m_canceled.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool isCanceled() const noexcept override
    {
        return m_canceled.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> m_canceled{false};
};

} // namespace healthsync::utility::cancelers

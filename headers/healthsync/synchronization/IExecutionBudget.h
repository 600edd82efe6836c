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

#include <healthsync/synchronization/Fwd.h>
#include <healthsync/utility/Linkage.h>

#include <QDeadlineTimer>

namespace healthsync::synchronization {

/**
 * @brief The IExecutionBudget interface tells the sync engine how much time
 * it has got to run. Under constrained execution smaller chunks are sent;
 * once the budget is exhausted, sync pauses until resumed later.
 */
class HEALTHSYNC_EXPORT IExecutionBudget
{
public:
    virtual ~IExecutionBudget() noexcept;

    [[nodiscard]] virtual bool isConstrained() const = 0;
    [[nodiscard]] virtual bool isExhausted() const = 0;
};

/**
 * Budget of the foreground execution: not constrained, never exhausted
 */
[[nodiscard]] HEALTHSYNC_EXPORT IExecutionBudgetPtr
    createUnlimitedExecutionBudget();

/**
 * Budget of the background execution window: constrained, exhausted once
 * the deadline is reached
 */
[[nodiscard]] HEALTHSYNC_EXPORT IExecutionBudgetPtr
    createDeadlineExecutionBudget(QDeadlineTimer deadline);

} // namespace healthsync::synchronization

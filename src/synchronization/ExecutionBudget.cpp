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


#include "ExecutionBudget.h"

#include <memory>

namespace healthsync::synchronization {

IExecutionBudget::~IExecutionBudget() noexcept = default;

DeadlineExecutionBudget::DeadlineExecutionBudget(
    const QDeadlineTimer deadline) : m_deadline{deadline}
{}

bool DeadlineExecutionBudget::isConstrained() const
{
    return true;
}

bool DeadlineExecutionBudget::isExhausted() const
{
    return m_deadline.hasExpired();
}

IExecutionBudgetPtr createUnlimitedExecutionBudget()
{
    return std::make_shared<UnlimitedExecutionBudget>();
}

IExecutionBudgetPtr createDeadlineExecutionBudget(QDeadlineTimer deadline)
{
    return std::make_shared<DeadlineExecutionBudget>(deadline);
}

} // namespace healthsync::synchronization

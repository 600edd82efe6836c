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

#include <synchronization/IOutboxStorage.h>

#include <gmock/gmock.h>

// clazy:excludeall=returning-void-expression

namespace healthsync::synchronization::tests::mocks {

class MockIOutboxStorage : public IOutboxStorage
{
public:
    MOCK_METHOD(OutboxItem, put, (OutboxItem item), (override));

    MOCK_METHOD(
        std::optional<OutboxItem>, item,
        (const QString & userKey, const QString & id), (const, override));

    MOCK_METHOD(
        QList<OutboxItem>, items, (const QString & userKey),
        (const, override));

    MOCK_METHOD(
        bool, remove, (const QString & userKey, const QString & id),
        (override));

    MOCK_METHOD(
        int, removeItemsOfOtherUsers, (const QString & userKey), (override));

    MOCK_METHOD(void, clear, (const QString & userKey), (override));
    MOCK_METHOD(int, size, (const QString & userKey), (const, override));
};

} // namespace healthsync::synchronization::tests::mocks

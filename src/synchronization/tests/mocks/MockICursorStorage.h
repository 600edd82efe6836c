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

#include <synchronization/ICursorStorage.h>

#include <gmock/gmock.h>

// clazy:excludeall=returning-void-expression

namespace healthsync::synchronization::tests::mocks {

class MockICursorStorage : public ICursorStorage
{
public:
    MOCK_METHOD(
        std::optional<Cursor>, cursor,
        (const QString & userKey, const TrackedType & type),
        (const, override));

    MOCK_METHOD(
        bool, commitCursor,
        (const QString & userKey, const TrackedType & type,
         const Cursor & cursor, qint64 sequence),
        (override));

    MOCK_METHOD(
        bool, isFullExportDone, (const QString & userKey), (const, override));

    MOCK_METHOD(
        void, setFullExportDone, (const QString & userKey, bool done),
        (override));

    MOCK_METHOD(void, clear, (const QString & userKey), (override));
};

} // namespace healthsync::synchronization::tests::mocks

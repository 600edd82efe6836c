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

#include <healthsync/synchronization/types/TypeAliases.h>
#include <healthsync/utility/Linkage.h>

#include <QJsonObject>
#include <QList>
#include <QStringList>

#include <optional>

namespace healthsync::synchronization {

/**
 * Section of the upload payload the record goes to
 */
enum class RecordKind
{
    Record,
    Workout,
    Sleep
};

/**
 * @brief Single health record already mapped into its wire representation
 */
struct HEALTHSYNC_EXPORT DataRecord
{
    RecordKind kind = RecordKind::Record;
    QJsonObject json;
};

/**
 * @brief Bounded batch of records returned by the data provider for one
 * query. Empty records list means the type is exhausted.
 */
struct HEALTHSYNC_EXPORT DataBatch
{
    QList<DataRecord> records;

    /**
     * Identifiers of records deleted in the source since the previous cursor
     */
    QStringList deletedIds;

    std::optional<Cursor> newCursor;
};

} // namespace healthsync::synchronization

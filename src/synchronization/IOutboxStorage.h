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
#include <healthsync/utility/Printable.h>

#include <QByteArray>
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QString>

#include <optional>

namespace healthsync::synchronization {

/**
 * @brief A chunk staged for delivery to the server. It is stored before the
 * upload starts and removed once the server acknowledges or permanently
 * rejects it, so the chunk survives crashes and network failures.
 */
struct OutboxItem : public Printable
{
    QTextStream & print(QTextStream & strm) const override;

    QString id;
    QString userKey;

    /**
     * Identifier of the tracked type the records belong to
     */
    QString typeTag;

    /**
     * Serialized request body
     */
    QByteArray payload;

    /**
     * Cursors to commit once the chunk is acknowledged
     */
    QHash<TrackedType, Cursor> cursors;

    bool fullExport = false;
    int recordCount = 0;
    QDateTime createdAt;

    /**
     * Strictly increasing among items staged by the storage, defines the
     * order in which the items were staged
     */
    qint64 sequence = 0;
};

/**
 * @brief The IOutboxStorage interface is the durable storage of staged
 * chunks, per user.
 */
class IOutboxStorage
{
public:
    virtual ~IOutboxStorage() = default;

    /**
     * Stores the item, assigning its id, sequence number and creation time.
     *
     * @return the stored item
     * @throw RuntimeError if the item could not be stored
     */
    [[nodiscard]] virtual OutboxItem put(OutboxItem item) = 0;

    [[nodiscard]] virtual std::optional<OutboxItem> item(
        const QString & userKey, const QString & id) const = 0;

    /**
     * @return items of the user sorted by sequence number; unreadable item
     *         files are removed
     */
    [[nodiscard]] virtual QList<OutboxItem> items(
        const QString & userKey) const = 0;

    /**
     * Removes the item; removal of already removed item is a no-op.
     *
     * @return true if the item existed and was removed
     */
    virtual bool remove(const QString & userKey, const QString & id) = 0;

    /**
     * Removes staged items of all users except the given one
     *
     * @return number of removed items
     */
    virtual int removeItemsOfOtherUsers(const QString & userKey) = 0;

    virtual void clear(const QString & userKey) = 0;

    [[nodiscard]] virtual int size(const QString & userKey) const = 0;
};

} // namespace healthsync::synchronization

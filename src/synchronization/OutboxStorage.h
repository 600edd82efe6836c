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

#include "IOutboxStorage.h"

#include <QDir>
#include <QMutex>

namespace healthsync::synchronization {

/**
 * IOutboxStorage implementation keeping each item in its own json file
 * <root>/<userKey>/outbox/<id>.json written with atomic replace
 */
class OutboxStorage final : public IOutboxStorage
{
public:
    explicit OutboxStorage(QDir rootDir);

    [[nodiscard]] OutboxItem put(OutboxItem item) override;

    [[nodiscard]] std::optional<OutboxItem> item(
        const QString & userKey, const QString & id) const override;

    [[nodiscard]] QList<OutboxItem> items(
        const QString & userKey) const override;

    bool remove(const QString & userKey, const QString & id) override;
    int removeItemsOfOtherUsers(const QString & userKey) override;
    void clear(const QString & userKey) override;

    [[nodiscard]] int size(const QString & userKey) const override;

private:
    [[nodiscard]] QDir outboxDir(const QString & userKey) const;
    [[nodiscard]] qint64 nextSequence();

private:
    const QDir m_rootDir;

    QMutex m_sequenceMutex;
    qint64 m_lastSequence = 0;
};

} // namespace healthsync::synchronization

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

#include "ICursorStorage.h"

#include <QDir>

namespace healthsync::synchronization {

/**
 * ICursorStorage implementation keeping cursors in
 * <root>/<userKey>/cursors.ini
 */
class CursorStorage final : public ICursorStorage
{
public:
    explicit CursorStorage(QDir rootDir);

    [[nodiscard]] std::optional<Cursor> cursor(
        const QString & userKey, const TrackedType & type) const override;

    bool commitCursor(
        const QString & userKey, const TrackedType & type,
        const Cursor & cursor, qint64 sequence) override;

    [[nodiscard]] bool isFullExportDone(
        const QString & userKey) const override;

    void setFullExportDone(const QString & userKey, bool done) override;

    void clear(const QString & userKey) override;

private:
    [[nodiscard]] QString settingsFilePath(const QString & userKey) const;

private:
    const QDir m_rootDir;
};

} // namespace healthsync::synchronization

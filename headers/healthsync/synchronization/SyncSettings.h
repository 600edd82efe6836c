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

#include <QList>
#include <QString>

namespace healthsync::synchronization {

/**
 * @brief The SyncSettings class persists across restarts the configuration
 * the host application needs to restore background sync on launch: the list
 * of tracked types and whether background sync is active.
 */
class HEALTHSYNC_EXPORT SyncSettings
{
public:
    /**
     * @param settingsFilePath      Path to ini file with settings
     */
    explicit SyncSettings(QString settingsFilePath);

    [[nodiscard]] QList<TrackedType> trackedTypes() const;
    void setTrackedTypes(const QList<TrackedType> & types);

    [[nodiscard]] bool isBackgroundSyncActive() const;
    void setBackgroundSyncActive(bool active);

    void clear();

private:
    const QString m_settingsFilePath;
};

} // namespace healthsync::synchronization

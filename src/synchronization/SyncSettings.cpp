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


#include <healthsync/synchronization/SyncSettings.h>
#include <healthsync/exception/InvalidArgument.h>
#include <healthsync/logging/HealthSyncLogger.h>

#include "Utils.h"

#include <QSettings>
#include <QStringList>

#include <string_view>

namespace healthsync::synchronization {

using namespace std::string_view_literals;

namespace {

constexpr auto gTrackedTypesKey = "Sync/trackedTypes"sv;
constexpr auto gBackgroundSyncActiveKey = "Sync/backgroundSyncActive"sv;

void checkStatus(const QSettings & settings)
{
    if (Q_UNLIKELY(settings.status() != QSettings::NoError)) {
        HSWARNING(
            "synchronization::SyncSettings",
            "Failed to persist sync settings to " << settings.fileName());
    }
}

} // namespace

SyncSettings::SyncSettings(QString settingsFilePath) :
    m_settingsFilePath{std::move(settingsFilePath)}
{
    if (Q_UNLIKELY(m_settingsFilePath.isEmpty())) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("SyncSettings ctor: settings file path is empty")}};
    }
}

QList<TrackedType> SyncSettings::trackedTypes() const
{
    const QSettings settings{m_settingsFilePath, QSettings::IniFormat};
    return settings.value(toString(gTrackedTypesKey)).toStringList();
}

void SyncSettings::setTrackedTypes(const QList<TrackedType> & types)
{
    QSettings settings{m_settingsFilePath, QSettings::IniFormat};
    settings.setValue(toString(gTrackedTypesKey), QStringList{types});
    settings.sync();
    checkStatus(settings);
}

bool SyncSettings::isBackgroundSyncActive() const
{
    const QSettings settings{m_settingsFilePath, QSettings::IniFormat};
    return settings.value(toString(gBackgroundSyncActiveKey), false).toBool();
}

void SyncSettings::setBackgroundSyncActive(const bool active)
{
    QSettings settings{m_settingsFilePath, QSettings::IniFormat};
    settings.setValue(toString(gBackgroundSyncActiveKey), active);
    settings.sync();
    checkStatus(settings);
}

void SyncSettings::clear()
{
    QSettings settings{m_settingsFilePath, QSettings::IniFormat};
    settings.clear();
    settings.sync();
    checkStatus(settings);
}

} // namespace healthsync::synchronization

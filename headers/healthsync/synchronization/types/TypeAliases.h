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

#include <QByteArray>
#include <QString>

namespace healthsync::synchronization {

/**
 * Identifier of one category of health records, i.e. a particular vital sign
 * kind, workouts, sleep analysis
 */
using TrackedType = QString;

/**
 * Opaque data provider's token meaning "everything up to here has been read"
 * for some tracked type
 */
using Cursor = QByteArray;

} // namespace healthsync::synchronization

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

#include <memory>

// Forward declarations of utility interfaces along with the smart pointer
// aliases used to pass them around

namespace healthsync::utility {

class IKeychainService;
using IKeychainServicePtr = std::shared_ptr<IKeychainService>;

} // namespace healthsync::utility

namespace healthsync::utility::cancelers {

class ICanceler;
using ICancelerPtr = std::shared_ptr<ICanceler>;

class ManualCanceler;
using ManualCancelerPtr = std::shared_ptr<ManualCanceler>;

} // namespace healthsync::utility::cancelers

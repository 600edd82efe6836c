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

namespace healthsync::synchronization {

class ICredentialsStore;
using ICredentialsStorePtr = std::shared_ptr<ICredentialsStore>;

class IDataProvider;
using IDataProviderPtr = std::shared_ptr<IDataProvider>;

class IExecutionBudget;
using IExecutionBudgetPtr = std::shared_ptr<IExecutionBudget>;

class ISyncEngine;
using ISyncEnginePtr = std::shared_ptr<ISyncEngine>;

class ISyncEventsNotifier;

class ISyncStateStorage;
using ISyncStateStoragePtr = std::shared_ptr<ISyncStateStorage>;

class SyncSettings;

} // namespace healthsync::synchronization

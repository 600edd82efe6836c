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

class IChunkTransmitter;
using IChunkTransmitterPtr = std::shared_ptr<IChunkTransmitter>;

class ICursorStorage;
using ICursorStoragePtr = std::shared_ptr<ICursorStorage>;

class INetworkClient;
using INetworkClientPtr = std::shared_ptr<INetworkClient>;

class IOutboxStorage;
using IOutboxStoragePtr = std::shared_ptr<IOutboxStorage>;

class ISyncOrchestrator;
using ISyncOrchestratorPtr = std::shared_ptr<ISyncOrchestrator>;

class ITokenRefreshCoordinator;
using ITokenRefreshCoordinatorPtr = std::shared_ptr<ITokenRefreshCoordinator>;

class ITypeStreamer;
using ITypeStreamerPtr = std::shared_ptr<ITypeStreamer>;

class ConnectivityMonitor;
class SyncEventsNotifier;

class SyncSession;
using SyncSessionPtr = std::shared_ptr<SyncSession>;

} // namespace healthsync::synchronization

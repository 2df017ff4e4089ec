/*
 * This file is part of coinpool, a mining sub-pool host
 * Copyright (c) 2021-2024 SChernykh <https://github.com/SChernykh>
 * Copyright (c) 2024 The coinpool developers
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, version 3.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include "uv_util.h"
#include "params.h"

namespace coinpool {

class PoolDatabase;
class RpcServer;
class DaemonSupervisor;
class WorkerMonitor;
class PoolSupervisor;
class ConsoleCommands;

class coinpool : public nocopy_nomove
{
public:
	coinpool(int argc, char* argv[]);
	~coinpool();

	int run();

	bool stopped() const { return m_stopped; }
	void stop();

	// Reads pool configs and worker lists again for every running pool
	void reload();

	const Params& params() const { return *m_params; }
	PoolSupervisor& supervisor() { return *m_supervisor; }

	void print_status() const;

private:
	static void on_stop(uv_async_t* async);

	uint32_t start_pools();

	std::atomic<bool> m_stopped;

	Params* m_params;

	PoolDatabase* m_db;
	RpcServer* m_rpcServer;
	DaemonSupervisor* m_daemons;
	WorkerMonitor* m_monitor;
	PoolSupervisor* m_supervisor;

	ConsoleCommands* m_consoleCommands;

	uv_async_t m_stopAsync;
};

} // namespace coinpool

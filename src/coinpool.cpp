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

#include "common.h"
#include "coinpool.h"
#include "params.h"
#include "pool_db.h"
#include "rpc_server.h"
#include "daemon_supervisor.h"
#include "worker_monitor.h"
#include "pool_supervisor.h"
#include "console_commands.h"

LOG_CATEGORY(CoinPool)

namespace coinpool {

coinpool::coinpool(int argc, char* argv[])
	: m_stopped(false)
	, m_params(nullptr)
	, m_db(nullptr)
	, m_rpcServer(nullptr)
	, m_daemons(nullptr)
	, m_monitor(nullptr)
	, m_supervisor(nullptr)
	, m_consoleCommands(nullptr)
	, m_stopAsync{}
{
	LOGINFO(1, log::LightCyan() << VERSION);

	Params* p = new Params(argc, argv);

	if (!p->valid()) {
		LOGERR(1, "Invalid or missing command line. Try \"coinpool --help\".");
		delete p;
		throw std::exception();
	}

	m_params = p;

	int err = uv_async_init(uv_default_loop_checked(), &m_stopAsync, on_stop);
	if (err) {
		LOGERR(1, "uv_async_init failed, error " << uv_err_name(err));
		throw std::exception();
	}
	m_stopAsync.data = this;

	m_db = new PoolDatabase(p->m_dbPath);
	m_rpcServer = new RpcServer(p->m_host);
	m_daemons = new DaemonSupervisor();
	m_monitor = new WorkerMonitor();

	PoolServices services;
	services.db = m_db;
	services.listener = m_rpcServer;
	services.daemons = m_daemons;
	services.monitor = m_monitor;

	m_supervisor = new PoolSupervisor(services, p->m_maxRestarts, p->m_restartWindow);

	try {
		m_consoleCommands = new ConsoleCommands(this);
	}
	catch (const std::exception&) {
		LOGERR(1, "Couldn't start console commands handler");
		m_consoleCommands = nullptr;
	}
}

coinpool::~coinpool()
{
	delete m_consoleCommands;

	// Pools use every other service, so they go first
	delete m_supervisor;
	delete m_rpcServer;
	delete m_daemons;
	delete m_monitor;
	delete m_db;

	delete m_params;
}

bool init_signals(coinpool* pool, bool init);

void coinpool::on_stop(uv_async_t* async)
{
	coinpool* pool = reinterpret_cast<coinpool*>(async->data);

	delete pool->m_consoleCommands;
	pool->m_consoleCommands = nullptr;

	uv_close(reinterpret_cast<uv_handle_t*>(&pool->m_stopAsync), nullptr);

	init_signals(pool, false);

	DeleteLoopUserData(uv_default_loop_checked());
}

static void on_signal(uv_signal_t* handle, int signum)
{
	coinpool* pool = reinterpret_cast<coinpool*>(handle->data);

	switch (signum) {
#ifdef SIGHUP
	case SIGHUP:
		LOGINFO(1, "caught SIGHUP, reloading pools");
		pool->reload();
		return;
#endif
	case SIGINT:
		LOGINFO(1, "caught SIGINT");
		break;
	case SIGTERM:
		LOGINFO(1, "caught SIGTERM");
		break;
#ifdef SIGBREAK
	case SIGBREAK:
		LOGINFO(1, "caught SIGBREAK");
		break;
#endif
#ifdef SIGUSR1
	case SIGUSR1:
		log::reopen();
		return;
#endif
	default:
		LOGINFO(1, "caught signal " << signum);
	}

	LOGINFO(1, "stopping");

	uv_signal_stop(handle);
	pool->stop();
}

bool init_signals(coinpool* pool, bool init)
{
#ifdef SIGPIPE
	signal(SIGPIPE, SIG_IGN);
#endif

	constexpr int signal_names[] = {
#ifdef SIGHUP
		SIGHUP,
#endif
		SIGINT,
		SIGTERM,
#ifdef SIGBREAK
		SIGBREAK,
#endif
#ifdef SIGUSR1
		SIGUSR1,
#endif
	};

	static uv_signal_t signals[array_size(signal_names)];

	if (!init) {
		for (size_t i = 0; i < array_size(signals); ++i) {
			uv_signal_stop(&signals[i]);
			uv_close(reinterpret_cast<uv_handle_t*>(&signals[i]), nullptr);
		}
		return true;
	}

	for (size_t i = 0; i < array_size(signal_names); ++i) {
		uv_signal_init(uv_default_loop_checked(), &signals[i]);
		signals[i].data = pool;
		const int rc = uv_signal_start(&signals[i], on_signal, signal_names[i]);
		if (rc != 0) {
			LOGERR(1, "failed to initialize signal, error " << rc);
			return false;
		}
	}

	return true;
}

void coinpool::stop()
{
	// Can be called only once
	if (m_stopped.exchange(true) == false) {
		uv_async_send(&m_stopAsync);
	}
}

void coinpool::reload()
{
	if (m_stopped) {
		return;
	}

	m_supervisor->reload_all();
}

void coinpool::print_status() const
{
	m_supervisor->print_status();
	m_rpcServer->print_status();
	m_daemons->print_status();
}

uint32_t coinpool::start_pools()
{
	std::vector<std::string> pools = m_params->m_pools;

	if (pools.empty() && !m_db->get_pool_ids(pools)) {
		LOGERR(1, "couldn't read the list of pools from " << m_db->filename());
		return 0;
	}

	uint32_t n = 0;

	for (const std::string& id : pools) {
		if (m_supervisor->start_pool(id)) {
			++n;
		}
		else {
			LOGWARN(1, "pool " << id << " didn't start, skipping it");
		}
	}

	return n;
}

int coinpool::run()
{
	if (!init_signals(this, true)) {
		LOGERR(1, "failed to initialize signal handlers");
		return 1;
	}

	// Init default loop user data before running it
	uv_loop_t* loop = uv_default_loop_checked();
	loop->data = nullptr;
	GetLoopUserData(loop);

	const uint32_t n = start_pools();
	if (n == 0) {
		LOGWARN(1, "no pools are running");
	}
	else {
		LOGINFO(1, n << " pool(s) started");
	}

	const int rc = uv_run(loop, UV_RUN_DEFAULT);
	LOGINFO(1, "uv_run exited, result = " << rc);

	m_stopped = true;

	m_supervisor->stop_all();

	LOGINFO(1, "stopped");
	return 0;
}

} // namespace coinpool

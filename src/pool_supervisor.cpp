/*
 * This file is part of coinpool, a mining sub-pool host
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
#include "pool_supervisor.h"
#include "pool_db.h"
#include "daemon_supervisor.h"
#include "worker_monitor.h"

LOG_CATEGORY(PoolSupervisor)

namespace coinpool {

PoolSupervisor::PoolSupervisor(const PoolServices& services, uint32_t max_restarts, uint32_t restart_window)
	: m_services(services)
	, m_maxRestarts(max_restarts)
	, m_restartWindow(restart_window)
	, m_stopping(false)
	, m_startStopLock{}
	, m_poolsLock{}
	, m_totalRestarts(0)
	, m_loop{}
	, m_loopThread{}
	, m_shutdownAsync{}
{
	int err = uv_loop_init(&m_loop);
	if (err) {
		LOGERR(1, "failed to create event loop, error " << uv_err_name(err));
		throw std::exception();
	}

	// Init loop user data before running it
	GetLoopUserData(&m_loop);

	err = uv_async_init(&m_loop, &m_shutdownAsync, on_shutdown);
	if (err) {
		LOGERR(1, "uv_async_init failed, error " << uv_err_name(err));
		DeleteLoopUserData(&m_loop);
		uv_run(&m_loop, UV_RUN_NOWAIT);
		uv_loop_close(&m_loop);
		throw std::exception();
	}
	m_shutdownAsync.data = this;

	uv_mutex_init_checked(&m_startStopLock);
	uv_rwlock_init_checked(&m_poolsLock);

	err = uv_thread_create(&m_loopThread, loop, this);
	if (err) {
		LOGERR(1, "failed to start event loop thread, error " << uv_err_name(err));
		uv_close(reinterpret_cast<uv_handle_t*>(&m_shutdownAsync), nullptr);
		DeleteLoopUserData(&m_loop);
		uv_run(&m_loop, UV_RUN_NOWAIT);
		uv_loop_close(&m_loop);

		uv_rwlock_destroy(&m_poolsLock);
		uv_mutex_destroy(&m_startStopLock);
		throw std::exception();
	}
}

PoolSupervisor::~PoolSupervisor()
{
	m_stopping = true;

	stop_all();

	uv_async_send(&m_shutdownAsync);
	uv_thread_join(&m_loopThread);

	uv_rwlock_destroy(&m_poolsLock);
	uv_mutex_destroy(&m_startStopLock);

	LOGINFO(1, "stopped");
}

bool PoolSupervisor::start_pool(const std::string& pool_id)
{
	MutexLock lock(m_startStopLock);

	if (m_stopping) {
		return false;
	}

	return start_pool_internal(pool_id);
}

bool PoolSupervisor::start_pool_internal(const std::string& pool_id)
{
	if (is_running(pool_id)) {
		LOGWARN(1, "pool " << pool_id << " is already running");
		return false;
	}

	PoolServer* server;
	try {
		server = new PoolServer(pool_id, m_services, this);
	}
	catch (const std::exception&) {
		LOGERR(1, "couldn't start pool " << pool_id);
		return false;
	}

	{
		WriteLock lock(m_poolsLock);
		m_pools.emplace(pool_id, server);
	}

	return true;
}

PoolServer* PoolSupervisor::take_pool(const std::string& pool_id)
{
	WriteLock lock(m_poolsLock);

	auto it = m_pools.find(pool_id);
	if (it == m_pools.end()) {
		return nullptr;
	}

	PoolServer* server = it->second;
	m_pools.erase(it);
	return server;
}

bool PoolSupervisor::stop_pool(const std::string& pool_id)
{
	MutexLock lock(m_startStopLock);
	return stop_pool_internal(pool_id);
}

bool PoolSupervisor::stop_pool_internal(const std::string& pool_id)
{
	PoolServer* server = take_pool(pool_id);
	if (!server) {
		LOGWARN(1, "pool " << pool_id << " is not running");
		return false;
	}

	delete server;
	m_services.daemons->stop(pool_id);

	LOGINFO(1, "pool " << pool_id << " was stopped");
	return true;
}

void PoolSupervisor::stop_all()
{
	// Holding the lock keeps a restart from slipping a new pool in after the snapshot
	MutexLock lock(m_startStopLock);

	for (const std::string& id : running_pools()) {
		stop_pool_internal(id);
	}
}

std::vector<std::string> PoolSupervisor::running_pools() const
{
	std::vector<std::string> result;
	{
		ReadLock lock(m_poolsLock);

		result.reserve(m_pools.size());
		for (const auto& it : m_pools) {
			result.push_back(it.first);
		}
	}

	std::sort(result.begin(), result.end());
	return result;
}

bool PoolSupervisor::is_running(const std::string& pool_id) const
{
	ReadLock lock(m_poolsLock);
	return m_pools.find(pool_id) != m_pools.end();
}

bool PoolSupervisor::reload_config(const PoolConfig& config)
{
	return with_pool(config.id, [&config](PoolServer* s) { return s->reload_config(config); });
}

bool PoolSupervisor::reload_workers(const std::string& pool_id)
{
	return with_pool(pool_id, [](PoolServer* s) { return s->reload_workers(); });
}

bool PoolSupervisor::update_worker(const std::string& pool_id, const Worker& worker)
{
	return with_pool(pool_id, [&worker](PoolServer* s) { return s->update_worker(worker); });
}

bool PoolSupervisor::remove_worker(const std::string& pool_id, const std::string& worker_id)
{
	return with_pool(pool_id, [&worker_id](PoolServer* s) { return s->remove_worker(worker_id); });
}

bool PoolSupervisor::rpc_request(const std::string& pool_id, RpcResponder* responder, const std::string& method, const std::string& params, const RpcAuth& auth)
{
	const bool found = with_pool(pool_id, [&](PoolServer* s) {
		s->rpc_request(responder, method, params, auth);
		return true;
	});

	if (!found) {
		LOGWARN(4, "RPC request for pool " << pool_id << " which is not running");
		delete responder;
	}

	return found;
}

bool PoolSupervisor::rpc_lp_request(const std::string& pool_id, RpcResponder* responder, const RpcAuth& auth)
{
	const bool found = with_pool(pool_id, [&](PoolServer* s) {
		s->rpc_lp_request(responder, auth);
		return true;
	});

	if (!found) {
		LOGWARN(4, "long poll request for pool " << pool_id << " which is not running");
		delete responder;
	}

	return found;
}

bool PoolSupervisor::get_worker_notifications(const std::string& pool_id, std::vector<std::string>& out_pools) const
{
	return with_pool(pool_id, [&out_pools](PoolServer* s) {
		out_pools = s->get_worker_notifications();
		return true;
	});
}

void PoolSupervisor::reload_all()
{
	const std::vector<std::string> pools = running_pools();

	LOGINFO(1, "reloading " << pools.size() << " pool(s)");

	for (const std::string& id : pools) {
		PoolConfig cfg;
		if (!m_services.db->get_pool_config(id, cfg)) {
			LOGERR(1, "couldn't load config for pool " << id << ", it keeps the current config");
			continue;
		}

		reload_config(cfg);
		reload_workers(id);
	}
}

uint32_t PoolSupervisor::worker_changed(const std::string& source_pool, const Worker& worker)
{
	uint32_t n = 0;

	for (const std::string& id : m_services.monitor->subscribers_of(source_pool)) {
		if (update_worker(id, worker)) {
			++n;
		}
	}

	LOGINFO(5, "worker " << worker.id << " changed in pool " << source_pool << ", notified " << n << " pool(s)");
	return n;
}

uint32_t PoolSupervisor::worker_removed(const std::string& source_pool, const std::string& worker_id)
{
	uint32_t n = 0;

	for (const std::string& id : m_services.monitor->subscribers_of(source_pool)) {
		if (remove_worker(id, worker_id)) {
			++n;
		}
	}

	LOGINFO(5, "worker " << worker_id << " removed from pool " << source_pool << ", notified " << n << " pool(s)");
	return n;
}

void PoolSupervisor::on_pool_server_failed(const std::string& pool_id)
{
	if (m_stopping) {
		return;
	}

	const bool posted = CallOnLoop(&m_loop, [this, pool_id]() { restart_pool(pool_id); });
	if (!posted) {
		LOGERR(1, "couldn't schedule a restart of pool " << pool_id);
	}
}

void PoolSupervisor::restart_pool(const std::string& pool_id)
{
	MutexLock lock(m_startStopLock);

	// stop_all() has already run or is waiting for this lock
	if (m_stopping) {
		return;
	}

	PoolServer* server = nullptr;
	{
		WriteLock lock2(m_poolsLock);

		auto it = m_pools.find(pool_id);

		// It could have been stopped or restarted already
		if ((it == m_pools.end()) || !it->second->failed()) {
			return;
		}

		server = it->second;
		m_pools.erase(it);
	}

	delete server;
	m_services.daemons->stop(pool_id);

	const uint64_t cur_time = seconds_since_epoch();

	std::vector<uint64_t>& history = m_restartHistory[pool_id];
	history.erase(std::remove_if(history.begin(), history.end(), [this, cur_time](uint64_t t) { return t + m_restartWindow <= cur_time; }), history.end());

	if (history.size() >= m_maxRestarts) {
		LOGERR(1, "pool " << pool_id << " failed " << history.size() << " times in the last " << m_restartWindow << " seconds, it will stay down");
		return;
	}

	history.push_back(cur_time);
	++m_totalRestarts;

	LOGWARN(1, "restarting pool " << pool_id << " (" << history.size() << '/' << m_maxRestarts << ')');

	if (!start_pool_internal(pool_id)) {
		LOGERR(1, "pool " << pool_id << " couldn't be restarted, it will stay down");
	}
}

void PoolSupervisor::loop(void* data)
{
	PoolSupervisor* s = static_cast<PoolSupervisor*>(data);

	LOGINFO(1, "event loop started");

	int err = uv_run(&s->m_loop, UV_RUN_DEFAULT);
	if (err) {
		LOGWARN(1, "uv_run returned " << err);
	}

	err = uv_loop_close(&s->m_loop);
	if (err) {
		LOGWARN(1, "uv_loop_close returned error " << uv_err_name(err));
	}

	LOGINFO(1, "event loop stopped");
}

void PoolSupervisor::print_status() const
{
	ReadLock lock(m_poolsLock);

	LOGINFO(0, "status" <<
		"\nPools running = " << m_pools.size() <<
		"\nRestarts      = " << m_totalRestarts.load()
	);

	for (const auto& it : m_pools) {
		it.second->print_status();
	}
}

} // namespace coinpool

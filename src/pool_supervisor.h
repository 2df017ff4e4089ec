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

#pragma once

#include "uv_util.h"
#include "pool_server.h"

namespace coinpool {

// Owns the pool servers: pool id -> PoolServer. Restarts a pool from scratch when it fails,
// at most max_restarts times within restart_window seconds.
class PoolSupervisor : public IPoolServerOwner, public nocopy_nomove
{
public:
	PoolSupervisor(const PoolServices& services, uint32_t max_restarts, uint32_t restart_window);
	~PoolSupervisor() override;

	bool start_pool(const std::string& pool_id);
	bool stop_pool(const std::string& pool_id);
	void stop_all();

	std::vector<std::string> running_pools() const;
	bool is_running(const std::string& pool_id) const;

	bool reload_config(const PoolConfig& config);
	bool reload_workers(const std::string& pool_id);
	bool update_worker(const std::string& pool_id, const Worker& worker);
	bool remove_worker(const std::string& pool_id, const std::string& worker_id);

	// The responder is always consumed, it's answered with an error if the pool is not running
	bool rpc_request(const std::string& pool_id, RpcResponder* responder, const std::string& method, const std::string& params, const RpcAuth& auth);
	bool rpc_lp_request(const std::string& pool_id, RpcResponder* responder, const RpcAuth& auth);

	bool get_worker_notifications(const std::string& pool_id, std::vector<std::string>& out_pools) const;

	// Reads the config of every running pool again and reloads it together with the worker list
	void reload_all();

	// Deliver a worker change made in source_pool to every pool subscribed to it.
	// Return the number of pools it was delivered to.
	uint32_t worker_changed(const std::string& source_pool, const Worker& worker);
	uint32_t worker_removed(const std::string& source_pool, const std::string& worker_id);

	void on_pool_server_failed(const std::string& pool_id) override;

	uint32_t total_restarts() const { return m_totalRestarts.load(); }

	template<typename T>
	bool with_pool(const std::string& pool_id, T&& callback) const
	{
		ReadLock lock(m_poolsLock);

		auto it = m_pools.find(pool_id);
		if (it == m_pools.end()) {
			return false;
		}

		return callback(it->second);
	}

	void print_status() const;

private:
	bool start_pool_internal(const std::string& pool_id);
	bool stop_pool_internal(const std::string& pool_id);
	PoolServer* take_pool(const std::string& pool_id);
	void restart_pool(const std::string& pool_id);

	static void loop(void* data);

	static void on_shutdown(uv_async_t* async)
	{
		PoolSupervisor* s = reinterpret_cast<PoolSupervisor*>(async->data);

		uv_close(reinterpret_cast<uv_handle_t*>(&s->m_shutdownAsync), nullptr);
		DeleteLoopUserData(&s->m_loop);
	}

	PoolServices m_services;
	uint32_t m_maxRestarts;
	uint32_t m_restartWindow;

	std::atomic<bool> m_stopping;

	// Serializes starting, stopping and restarting pools
	uv_mutex_t m_startStopLock;

	mutable uv_rwlock_t m_poolsLock;
	unordered_map<std::string, PoolServer*> m_pools;

	unordered_map<std::string, std::vector<uint64_t>> m_restartHistory;
	std::atomic<uint32_t> m_totalRestarts;

	uv_loop_t m_loop;
	uv_thread_t m_loopThread;
	uv_async_t m_shutdownAsync;
};

} // namespace coinpool

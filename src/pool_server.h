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
#include "worker_registry.h"
#include "rpc_request.h"
#include <deque>

namespace coinpool {

class IPoolDatabase;
class IDaemonSupervisor;
class IWorkerMonitor;
class ICoinDaemon;
struct CoinDaemonType;

struct PoolServices
{
	IPoolDatabase* db;
	IRpcListener* listener;
	IDaemonSupervisor* daemons;
	IWorkerMonitor* monitor;
};

class IPoolServerOwner
{
public:
	virtual ~IPoolServerOwner() {}

	// Called from the failed pool's own thread, the pool server must not be destroyed from inside this call
	virtual void on_pool_server_failed(const std::string& pool_id) = 0;
};

class PoolServer : public IRpcHandler, public nocopy_nomove
{
public:
	enum class MessageType {
		ReloadConfig,
		ReloadWorkers,
		UpdateWorker,
		RemoveWorker,
		RpcRequest,
		RpcLongPollRequest,
	};

	struct Message : public nocopy_nomove
	{
		explicit FORCEINLINE Message(MessageType t) : type(t), responder(nullptr) {}
		FORCEINLINE ~Message() { delete responder; }

		MessageType type;

		PoolConfig config;
		Worker worker;
		std::string worker_id;

		RpcResponder* responder;
		std::string method;
		std::string params;
		RpcAuth auth;
	};

	// Throws std::exception if the pool config can't be loaded
	PoolServer(const std::string& pool_id, const PoolServices& services, IPoolServerOwner* owner);

	// Processes every message that was posted before, then stops the listener and the worker notifications
	~PoolServer() override;

	const std::string& pool_id() const { return m_poolId; }

	// All of these return false if the pool server is no longer running, the message is discarded then
	bool post(Message* msg);
	bool reload_config(const PoolConfig& config);
	bool reload_workers();
	bool update_worker(const Worker& worker);
	bool remove_worker(const std::string& worker_id);

	bool rpc_request(RpcResponder* responder, const std::string& method, const std::string& params, const RpcAuth& auth) override;
	bool rpc_lp_request(RpcResponder* responder, const RpcAuth& auth) override;

	// Can be called from any thread
	std::vector<std::string> get_worker_notifications() const;

	bool stopped() const;
	bool failed() const { return m_failed.load(); }
	uint64_t dropped_messages() const { return m_droppedMessages.load(); }

	PoolConfig config() const;
	int32_t listener_port() const;

	// nullptr until a config with a working coin daemon was applied
	const CoinDaemonType* daemon_type() const;
	const WorkerRegistry& workers() const { return m_workers; }

	void print_status() const;

private:
	static void loop(void* data);

	static void on_messages(uv_async_t* async) { reinterpret_cast<PoolServer*>(async->data)->process_messages(); }
	void process_messages();
	bool handle_message(Message* msg);

	bool handle_reload_config(const PoolConfig& new_config);
	bool handle_reload_workers();
	void handle_rpc_request(Message* msg);
	void handle_rpc_lp_request(Message* msg);

	void fail();
	void terminate();

	static void on_shutdown(uv_async_t* async)
	{
		PoolServer* server = reinterpret_cast<PoolServer*>(async->data);
		server->on_shutdown();

		uv_close(reinterpret_cast<uv_handle_t*>(&server->m_messagesAsync), nullptr);
		uv_close(reinterpret_cast<uv_handle_t*>(&server->m_shutdownAsync), nullptr);
	}

	void on_shutdown();

	const std::string m_poolId;
	PoolServices m_services;
	IPoolServerOwner* m_owner;

	mutable uv_rwlock_t m_stateLock;
	PoolConfig m_config;
	bool m_hasConfig;
	const CoinDaemonType* m_daemonType;
	ICoinDaemon* m_daemon;
	int32_t m_listenerPort;
	bool m_terminated;

	WorkerRegistry m_workers;
	// Nothing issues work units yet, they only live as long as the pool server
	std::vector<WorkUnit> m_workUnits;

	mutable uv_mutex_t m_messagesLock;
	std::deque<Message*> m_messages;
	bool m_stopped;

	std::atomic<bool> m_failed;
	std::atomic<uint64_t> m_droppedMessages;

	uv_loop_t m_loop;
	uv_thread_t m_loopThread;
	uv_async_t m_messagesAsync;
	uv_async_t m_shutdownAsync;
};

} // namespace coinpool

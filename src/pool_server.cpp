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
#include "pool_server.h"
#include "pool_db.h"
#include "coin_daemon.h"
#include "daemon_supervisor.h"
#include "worker_monitor.h"
#include "config_reconciler.h"

LOG_CATEGORY(PoolServer)

namespace coinpool {

PoolServer::PoolServer(const std::string& pool_id, const PoolServices& services, IPoolServerOwner* owner)
	: m_poolId(pool_id)
	, m_services(services)
	, m_owner(owner)
	, m_stateLock{}
	, m_hasConfig(false)
	, m_daemonType(nullptr)
	, m_daemon(nullptr)
	, m_listenerPort(0)
	, m_terminated(false)
	, m_messagesLock{}
	, m_stopped(false)
	, m_failed(false)
	, m_droppedMessages(0)
	, m_loop{}
	, m_loopThread{}
	, m_messagesAsync{}
	, m_shutdownAsync{}
{
	LOGINFO(1, "starting pool " << log::LightCyan() << m_poolId);

	PoolConfig cfg;
	if (!m_services.db->get_pool_config(m_poolId, cfg)) {
		LOGERR(1, "pool " << m_poolId << ": couldn't load pool config");
		throw std::exception();
	}

	int err = uv_loop_init(&m_loop);
	if (err) {
		LOGERR(1, "failed to create event loop, error " << uv_err_name(err));
		throw std::exception();
	}

	err = uv_async_init(&m_loop, &m_messagesAsync, on_messages);
	if (err) {
		LOGERR(1, "uv_async_init failed, error " << uv_err_name(err));
		uv_loop_close(&m_loop);
		throw std::exception();
	}
	m_messagesAsync.data = this;

	err = uv_async_init(&m_loop, &m_shutdownAsync, on_shutdown);
	if (err) {
		LOGERR(1, "uv_async_init failed, error " << uv_err_name(err));
		uv_close(reinterpret_cast<uv_handle_t*>(&m_messagesAsync), nullptr);
		uv_run(&m_loop, UV_RUN_NOWAIT);
		uv_loop_close(&m_loop);
		throw std::exception();
	}
	m_shutdownAsync.data = this;

	uv_rwlock_init_checked(&m_stateLock);
	uv_mutex_init_checked(&m_messagesLock);

	// The config that was just loaded is applied as the first message, the worker list follows
	Message* msg = new Message(MessageType::ReloadConfig);
	msg->config = std::move(cfg);
	m_messages.push_back(msg);
	m_messages.push_back(new Message(MessageType::ReloadWorkers));

	err = uv_thread_create(&m_loopThread, loop, this);
	if (err) {
		LOGERR(1, "failed to start event loop thread, error " << uv_err_name(err));

		for (Message* m : m_messages) {
			delete m;
		}
		m_messages.clear();

		uv_close(reinterpret_cast<uv_handle_t*>(&m_messagesAsync), nullptr);
		uv_close(reinterpret_cast<uv_handle_t*>(&m_shutdownAsync), nullptr);
		uv_run(&m_loop, UV_RUN_NOWAIT);
		uv_loop_close(&m_loop);

		uv_mutex_destroy(&m_messagesLock);
		uv_rwlock_destroy(&m_stateLock);
		throw std::exception();
	}

	uv_async_send(&m_messagesAsync);
}

PoolServer::~PoolServer()
{
	{
		MutexLock lock(m_messagesLock);
		m_stopped = true;
	}

	uv_async_send(&m_shutdownAsync);
	uv_thread_join(&m_loopThread);

	uv_mutex_destroy(&m_messagesLock);
	uv_rwlock_destroy(&m_stateLock);

	LOGINFO(1, "pool " << m_poolId << " stopped");
}

bool PoolServer::post(Message* msg)
{
	{
		MutexLock lock(m_messagesLock);

		if (!m_stopped) {
			m_messages.push_back(msg);
			uv_async_send(&m_messagesAsync);
			return true;
		}
	}

	LOGWARN(4, "pool " << m_poolId << " is not running, message discarded");
	delete msg;
	return false;
}

bool PoolServer::reload_config(const PoolConfig& config)
{
	if (config.id != m_poolId) {
		LOGERR(1, "pool " << m_poolId << ": got config for pool " << config.id << ", ignoring it");
		return false;
	}

	Message* msg = new Message(MessageType::ReloadConfig);
	msg->config = config;
	return post(msg);
}

bool PoolServer::reload_workers()
{
	return post(new Message(MessageType::ReloadWorkers));
}

bool PoolServer::update_worker(const Worker& worker)
{
	Message* msg = new Message(MessageType::UpdateWorker);
	msg->worker = worker;
	return post(msg);
}

bool PoolServer::remove_worker(const std::string& worker_id)
{
	Message* msg = new Message(MessageType::RemoveWorker);
	msg->worker_id = worker_id;
	return post(msg);
}

bool PoolServer::rpc_request(RpcResponder* responder, const std::string& method, const std::string& params, const RpcAuth& auth)
{
	if (!responder) {
		LOGERR(1, "pool " << m_poolId << ": RPC request without a responder");
		return false;
	}

	Message* msg = new Message(MessageType::RpcRequest);
	msg->responder = responder;
	msg->method = method;
	msg->params = params;
	msg->auth = auth;
	return post(msg);
}

bool PoolServer::rpc_lp_request(RpcResponder* responder, const RpcAuth& auth)
{
	if (!responder) {
		LOGERR(1, "pool " << m_poolId << ": long poll request without a responder");
		return false;
	}

	Message* msg = new Message(MessageType::RpcLongPollRequest);
	msg->responder = responder;
	msg->auth = auth;
	return post(msg);
}

std::vector<std::string> PoolServer::get_worker_notifications() const
{
	return std::vector<std::string>{ m_poolId };
}

bool PoolServer::stopped() const
{
	MutexLock lock(m_messagesLock);
	return m_stopped;
}

PoolConfig PoolServer::config() const
{
	ReadLock lock(m_stateLock);
	return m_config;
}

int32_t PoolServer::listener_port() const
{
	ReadLock lock(m_stateLock);
	return m_listenerPort;
}

const CoinDaemonType* PoolServer::daemon_type() const
{
	ReadLock lock(m_stateLock);
	return m_daemon ? m_daemonType : nullptr;
}

void PoolServer::print_status() const
{
	PoolConfig cfg;
	int32_t port;
	const char* daemon = "none";
	{
		ReadLock lock(m_stateLock);
		cfg = m_config;
		port = m_listenerPort;
		if (m_daemon && m_daemonType) {
			daemon = m_daemonType->pool_type;
		}
	}

	char failed_buf[64] = {};
	if (m_failed) {
		log::Stream s(failed_buf);
		s << log::Yellow() << "\nState            = failed" << log::NoColor();
	}

	LOGINFO(0, "pool " << m_poolId <<
		"\nPool type        = " << cfg.pool_type <<
		"\nListener port    = " << port <<
		"\nCoin daemon      = " << daemon <<
		"\nWorkers          = " << m_workers.size() <<
		"\nWork units       = " << m_workUnits.size() <<
		"\nDropped messages = " << m_droppedMessages.load() << static_cast<const char*>(failed_buf)
	);
}

void PoolServer::loop(void* data)
{
	PoolServer* server = static_cast<PoolServer*>(data);

	LOGINFO(1, "pool " << server->m_poolId << ": event loop started");

	int err = uv_run(&server->m_loop, UV_RUN_DEFAULT);
	if (err) {
		LOGWARN(1, "uv_run returned " << err);
	}

	err = uv_loop_close(&server->m_loop);
	if (err) {
		LOGWARN(1, "uv_loop_close returned error " << uv_err_name(err));
	}

	LOGINFO(1, "pool " << server->m_poolId << ": event loop stopped");
}

void PoolServer::process_messages()
{
	for (;;) {
		Message* msg;
		{
			MutexLock lock(m_messagesLock);

			if (m_messages.empty()) {
				return;
			}

			msg = m_messages.front();
			m_messages.pop_front();
		}

		if (m_terminated) {
			delete msg;
			continue;
		}

		const bool ok = handle_message(msg);
		delete msg;

		if (!ok) {
			fail();
		}
	}
}

bool PoolServer::handle_message(Message* msg)
{
	switch (msg->type) {
	case MessageType::ReloadConfig:
		return handle_reload_config(msg->config);

	case MessageType::ReloadWorkers:
		return handle_reload_workers();

	case MessageType::UpdateWorker:
		m_workers.update(msg->worker);
		return true;

	case MessageType::RemoveWorker:
		m_workers.remove(msg->worker_id);
		return true;

	case MessageType::RpcRequest:
		handle_rpc_request(msg);
		return true;

	case MessageType::RpcLongPollRequest:
		handle_rpc_lp_request(msg);
		return true;
	}

	++m_droppedMessages;
	LOGWARN(3, "pool " << m_poolId << ": dropped message of unknown type " << static_cast<int>(msg->type));
	return true;
}

bool PoolServer::handle_reload_config(const PoolConfig& new_config)
{
	ReconcilePlan plan;
	if (!reconcile(m_hasConfig ? &m_config : nullptr, new_config, plan)) {
		return false;
	}

	IRpcListener* listener = m_services.listener;
	bool listener_started = false;

	if ((plan.listener == ReconcilePlan::ListenerAction::Stop) || (plan.listener == ReconcilePlan::ListenerAction::StopThenStart)) {
		listener->stop(plan.old_port);

		WriteLock lock(m_stateLock);
		m_listenerPort = 0;
	}

	if ((plan.listener == ReconcilePlan::ListenerAction::Start) || (plan.listener == ReconcilePlan::ListenerAction::StopThenStart)) {
		if (!listener->start(plan.new_port, this)) {
			LOGERR(1, "pool " << m_poolId << ": failed to start listener on port " << plan.new_port);
			return false;
		}
		listener_started = true;

		WriteLock lock(m_stateLock);
		m_listenerPort = plan.new_port;
	}

	ICoinDaemon* daemon = m_daemon;

	if (plan.daemon != ReconcilePlan::DaemonAction::None) {
		if (plan.daemon == ReconcilePlan::DaemonAction::StopThenStart) {
			{
				WriteLock lock(m_stateLock);
				m_daemon = nullptr;
			}
			m_services.daemons->stop(m_poolId);
		}

		daemon = m_services.daemons->start(m_poolId, *plan.daemon_type, new_config.coin_daemon_config);
		if (!daemon) {
			LOGERR(1, "pool " << m_poolId << ": failed to start " << plan.daemon_type->pool_type << " coin daemon");

			if (listener_started) {
				listener->stop(plan.new_port);

				WriteLock lock(m_stateLock);
				m_listenerPort = 0;
			}
			return false;
		}
	}

	{
		WriteLock lock(m_stateLock);
		m_config = new_config;
		m_hasConfig = true;
		m_daemonType = plan.daemon_type;
		m_daemon = daemon;
	}

	LOGINFO(2, "pool " << m_poolId << ": config applied (" << m_daemonType->pool_type << ", port " << m_config.port << ')');
	return true;
}

bool PoolServer::handle_reload_workers()
{
	m_workers.clear();

	const std::vector<std::string> pools = get_worker_notifications();

	std::vector<Worker> workers;
	if (m_services.db->get_workers_for_pools(pools, workers)) {
		m_workers.replace_all(workers);
		LOGINFO(3, "pool " << m_poolId << ": loaded " << m_workers.size() << " workers");
	}
	else {
		LOGERR(1, "pool " << m_poolId << ": couldn't load workers, worker list is empty now");
	}

	m_services.monitor->set_worker_notifications(m_poolId, pools);
	return true;
}

void PoolServer::handle_rpc_request(Message* msg)
{
	Worker worker;
	if (!m_workers.find_by_name(msg->auth.user, worker)) {
		LOGINFO(5, "pool " << m_poolId << ": unauthorized request from \"" << msg->auth.user << '"');
		msg->responder->respond(RpcResult(RpcResult::Status::Unauthorized));
		return;
	}

	LOGINFO(6, "pool " << m_poolId << ": worker " << worker.name << " called " << msg->method);
	msg->responder->respond(RpcResult(RpcResult::Status::MethodNotFound));
}

void PoolServer::handle_rpc_lp_request(Message* msg)
{
	LOGINFO(6, "pool " << m_poolId << ": long poll request from \"" << msg->auth.user << '"');
	msg->responder->respond(RpcResult(RpcResult::Status::NotImplemented));
}

void PoolServer::fail()
{
	LOGERR(1, "pool " << m_poolId << " failed, shutting it down");

	m_failed = true;

	std::deque<Message*> discarded;
	{
		MutexLock lock(m_messagesLock);
		m_stopped = true;
		discarded.swap(m_messages);
	}

	terminate();

	// Pending requests are answered with an error when their responders are destroyed
	for (Message* msg : discarded) {
		delete msg;
	}

	if (m_owner) {
		m_owner->on_pool_server_failed(m_poolId);
	}
}

void PoolServer::terminate()
{
	if (m_terminated) {
		return;
	}
	m_terminated = true;

	int32_t port;
	{
		WriteLock lock(m_stateLock);
		port = m_listenerPort;
		m_listenerPort = 0;
	}

	if (port) {
		m_services.listener->stop(port);
	}

	m_services.monitor->set_worker_notifications(m_poolId, std::vector<std::string>());
}

void PoolServer::on_shutdown()
{
	process_messages();
	terminate();
}

} // namespace coinpool

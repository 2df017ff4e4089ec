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
#include "test_services.h"
#include "gtest/gtest.h"

namespace coinpool {

static RpcResult call(PoolSupervisor& s, const std::string& pool_id, const std::string& user)
{
	return call([&s, &pool_id](RpcResponder* r, const RpcAuth& auth) { s.rpc_request(pool_id, r, "getwork", "[]", auth); }, user);
}

static int32_t listener_port(PoolSupervisor& s, const std::string& pool_id)
{
	int32_t port = -1;
	s.with_pool(pool_id, [&port](PoolServer* server) {
		port = server->listener_port();
		return true;
	});
	return port;
}

TEST(pool_supervisor, start_stop)
{
	TestServices t;
	t.db.set_pool(make_pool("p1", 8001));
	t.db.set_pool(make_pool("p2", 8002));

	PoolSupervisor s(t.services, 5, 60);

	ASSERT_TRUE(s.start_pool("p1"));
	ASSERT_TRUE(s.start_pool("p2"));
	ASSERT_FALSE(s.start_pool("p1"));
	ASSERT_FALSE(s.start_pool("p3"));

	ASSERT_EQ(s.running_pools(), (std::vector<std::string>{ "p1", "p2" }));
	ASSERT_TRUE(s.is_running("p1"));
	ASSERT_FALSE(s.is_running("p3"));

	ASSERT_EQ(call(s, "p1", "nobody").status, RpcResult::Status::Unauthorized);
	ASSERT_EQ(listener_port(s, "p1"), 8001);

	std::vector<std::string> pools;
	ASSERT_TRUE(s.get_worker_notifications("p2", pools));
	ASSERT_EQ(pools, (std::vector<std::string>{ "p2" }));
	ASSERT_FALSE(s.get_worker_notifications("p3", pools));

	ASSERT_TRUE(s.stop_pool("p1"));
	ASSERT_FALSE(s.stop_pool("p1"));
	ASSERT_FALSE(s.is_running("p1"));

	const std::vector<std::string> calls = t.listener.calls();
	ASSERT_NE(std::find(calls.begin(), calls.end(), "stop 8001"), calls.end());

	// Requests for pools that are not running are answered right away
	ASSERT_EQ(call(s, "p1", "nobody").status, RpcResult::Status::Error);

	s.stop_all();
	ASSERT_TRUE(s.running_pools().empty());
	ASSERT_EQ(t.daemons.running(), 0U);
	ASSERT_TRUE(t.monitor.subscribers_of("p2").empty());
}

TEST(pool_supervisor, worker_changes)
{
	TestServices t;
	t.db.set_pool(make_pool("p1", 8001));
	t.db.set_pool(make_pool("p2", 8002));

	PoolSupervisor s(t.services, 5, 60);

	ASSERT_TRUE(s.start_pool("p1"));
	ASSERT_TRUE(s.start_pool("p2"));

	ASSERT_EQ(call(s, "p1", "nobody").status, RpcResult::Status::Unauthorized);
	ASSERT_EQ(call(s, "p2", "nobody").status, RpcResult::Status::Unauthorized);

	ASSERT_EQ(s.worker_changed("p1", make_worker("1", "alice", "p1")), 1U);

	ASSERT_EQ(call(s, "p1", "alice").status, RpcResult::Status::MethodNotFound);
	ASSERT_EQ(call(s, "p2", "alice").status, RpcResult::Status::Unauthorized);

	ASSERT_EQ(s.worker_removed("p1", "1"), 1U);
	ASSERT_EQ(call(s, "p1", "alice").status, RpcResult::Status::Unauthorized);

	// Nobody listens to worker changes of p3
	ASSERT_EQ(s.worker_changed("p3", make_worker("2", "bob", "p3")), 0U);
}

TEST(pool_supervisor, reload_all)
{
	TestServices t;
	t.db.set_pool(make_pool("p1", 8001));

	PoolSupervisor s(t.services, 5, 60);

	ASSERT_TRUE(s.start_pool("p1"));
	ASSERT_EQ(call(s, "p1", "alice").status, RpcResult::Status::Unauthorized);

	t.db.set_pool(make_pool("p1", 8005));
	t.db.add_worker(make_worker("1", "alice", "p1"));

	s.reload_all();

	ASSERT_EQ(call(s, "p1", "alice").status, RpcResult::Status::MethodNotFound);
	ASSERT_EQ(listener_port(s, "p1"), 8005);
}

TEST(pool_supervisor, restart)
{
	TestServices t;
	t.db.set_pool(make_pool("p1", 8001));
	t.db.add_worker(make_worker("1", "alice", "p1"));

	PoolSupervisor s(t.services, 5, 60);

	ASSERT_TRUE(s.start_pool("p1"));
	ASSERT_EQ(call(s, "p1", "alice").status, RpcResult::Status::MethodNotFound);

	// A broken config makes the pool fail, it's restarted from the database state
	ASSERT_TRUE(s.reload_config(make_pool("p1", 8001, BAD_DAEMON)));
	ASSERT_TRUE(wait_for([&s]() { return s.total_restarts() == 1; }));
	ASSERT_TRUE(wait_for([&s]() { return listener_port(s, "p1") == 8001; }));

	ASSERT_EQ(call(s, "p1", "alice").status, RpcResult::Status::MethodNotFound);
	ASSERT_TRUE(s.is_running("p1"));

	bool failed = true;
	s.with_pool("p1", [&failed](PoolServer* server) {
		failed = server->failed();
		return true;
	});
	ASSERT_FALSE(failed);
}

TEST(pool_supervisor, restart_limit)
{
	TestServices t;
	t.db.set_pool(make_pool("p1", 8001, BAD_DAEMON));

	PoolSupervisor s(t.services, 2, 60);

	ASSERT_TRUE(s.start_pool("p1"));

	// The first start and two restarts, then the pool stays down
	ASSERT_TRUE(wait_for([&t, &s]() { return (t.daemons.num_starts() == 3) && !s.is_running("p1"); }));

	std::this_thread::sleep_for(std::chrono::milliseconds(200));

	ASSERT_EQ(t.daemons.num_starts(), 3U);
	ASSERT_EQ(s.total_restarts(), 2U);
	ASSERT_FALSE(s.is_running("p1"));

	// It can still be started by hand once the config is fixed
	t.db.set_pool(make_pool("p1", 8001));
	ASSERT_TRUE(s.start_pool("p1"));
	ASSERT_EQ(call(s, "p1", "nobody").status, RpcResult::Status::Unauthorized);
	ASSERT_EQ(listener_port(s, "p1"), 8001);
}

TEST(pool_supervisor, no_restarts)
{
	TestServices t;
	t.db.set_pool(make_pool("p1", 8001, BAD_DAEMON));

	PoolSupervisor s(t.services, 0, 60);

	ASSERT_TRUE(s.start_pool("p1"));
	ASSERT_TRUE(wait_for([&s]() { return !s.is_running("p1"); }));

	ASSERT_EQ(s.total_restarts(), 0U);
	ASSERT_EQ(t.daemons.num_starts(), 1U);
}

TEST(pool_supervisor, shutdown_during_restarts)
{
	TestServices t;
	t.db.set_pool(make_pool("p1", 8001, BAD_DAEMON));

	{
		PoolSupervisor s(t.services, 1000000, 60);

		ASSERT_TRUE(s.start_pool("p1"));

		// The pool keeps failing and being restarted while the supervisor shuts down
		ASSERT_TRUE(wait_for([&t]() { return t.daemons.num_starts() >= 3; }));
	}

	const std::vector<std::string> calls = t.listener.calls();
	const size_t daemon_starts = t.daemons.num_starts();

	// No pool outlives the supervisor
	std::this_thread::sleep_for(std::chrono::milliseconds(200));

	ASSERT_EQ(t.listener.calls(), calls);
	ASSERT_EQ(t.daemons.num_starts(), daemon_starts);
	ASSERT_EQ(t.daemons.running(), 0U);
	ASSERT_TRUE(t.monitor.subscribers_of("p1").empty());

	const auto starts = std::count(calls.begin(), calls.end(), "start 8001");
	const auto stops = std::count(calls.begin(), calls.end(), "stop 8001");
	ASSERT_GT(starts, 0);
	ASSERT_EQ(starts, stops);
}

}

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
#include "pool_db.h"
#include "gtest/gtest.h"
#include <fstream>

namespace coinpool {

static const char* test_db_file = "coinpool_tests_pools.json";

static void write_db(const char* data)
{
	std::ofstream f(test_db_file, std::ios::binary | std::ios::trunc);
	f << data;
}

class pool_db : public ::testing::Test
{
protected:
	void TearDown() override { std::remove(test_db_file); }
};

TEST_F(pool_db, load)
{
	write_db(
		"{\n"
		"  // comments and trailing commas are allowed\n"
		"  \"pools\": [\n"
		"    { \"id\": \"btc-main\", \"port\": 8001, \"pool_type\": \"btc\", \"coin_daemon\": { \"host\": \"127.0.0.1\", \"port\": 8332 } },\n"
		"    { \"id\": \"ltc-main\", \"pool_type\": \"ltc\" },\n"
		"  ],\n"
		"  \"workers\": [\n"
		"    { \"id\": \"1\", \"pool\": \"btc-main\", \"name\": \"alice\", \"password\": \"x\" },\n"
		"    { \"id\": \"2\", \"pool\": \"ltc-main\", \"name\": \"bob\" },\n"
		"    { \"id\": \"3\", \"pool\": \"btc-main\", \"name\": \"carol\" },\n"
		"  ],\n"
		"}\n"
	);

	PoolDatabase db(test_db_file);

	std::vector<std::string> ids;
	ASSERT_TRUE(db.get_pool_ids(ids));
	ASSERT_EQ(ids, (std::vector<std::string>{ "btc-main", "ltc-main" }));

	PoolConfig cfg;
	ASSERT_TRUE(db.get_pool_config("btc-main", cfg));
	ASSERT_EQ(cfg.id, "btc-main");
	ASSERT_EQ(cfg.port, 8001);
	ASSERT_EQ(cfg.pool_type, "btc");
	ASSERT_EQ(cfg.coin_daemon_config, "{\"host\":\"127.0.0.1\",\"port\":8332}");

	ASSERT_TRUE(db.get_pool_config("ltc-main", cfg));
	ASSERT_EQ(cfg.port, 0);
	ASSERT_TRUE(cfg.coin_daemon_config.empty());

	ASSERT_FALSE(db.get_pool_config("doge-main", cfg));

	std::vector<Worker> workers;
	ASSERT_TRUE(db.get_workers_for_pools({ "btc-main" }, workers));
	ASSERT_EQ(workers.size(), 2U);
	ASSERT_EQ(workers[0].name, "alice");
	ASSERT_EQ(workers[0].pool_id, "btc-main");
	ASSERT_EQ(workers[0].extra, "{\"password\":\"x\"}");
	ASSERT_EQ(workers[1].name, "carol");
	ASSERT_EQ(workers[1].extra, "{}");

	ASSERT_TRUE(db.get_workers_for_pools({ "btc-main", "ltc-main" }, workers));
	ASSERT_EQ(workers.size(), 3U);

	ASSERT_TRUE(db.get_workers_for_pools({}, workers));
	ASSERT_TRUE(workers.empty());
}

TEST_F(pool_db, changes_are_picked_up)
{
	write_db("{ \"pools\": [ { \"id\": \"p1\", \"port\": 8001, \"pool_type\": \"btc\" } ] }");

	PoolDatabase db(test_db_file);

	PoolConfig cfg;
	ASSERT_TRUE(db.get_pool_config("p1", cfg));
	ASSERT_EQ(cfg.port, 8001);

	write_db("{ \"pools\": [ { \"id\": \"p1\", \"port\": 8002, \"pool_type\": \"btc\" } ] }");

	ASSERT_TRUE(db.get_pool_config("p1", cfg));
	ASSERT_EQ(cfg.port, 8002);
}

TEST_F(pool_db, invalid_data)
{
	PoolDatabase db(test_db_file);

	std::vector<std::string> ids;
	PoolConfig cfg;

	// No file
	ASSERT_FALSE(db.get_pool_ids(ids));

	write_db("not json");
	ASSERT_FALSE(db.get_pool_ids(ids));

	write_db("[]");
	ASSERT_FALSE(db.get_pool_ids(ids));

	write_db("{ \"pools\": {} }");
	ASSERT_FALSE(db.get_pool_ids(ids));

	write_db("{ \"pools\": [ { \"port\": 8001, \"pool_type\": \"btc\" } ] }");
	ASSERT_FALSE(db.get_pool_ids(ids));

	write_db("{ \"pools\": [ { \"id\": \"p1\", \"port\": 70000, \"pool_type\": \"btc\" } ] }");
	ASSERT_FALSE(db.get_pool_config("p1", cfg));

	write_db("{ \"pools\": [ { \"id\": \"p1\", \"port\": 8001 } ] }");
	ASSERT_FALSE(db.get_pool_config("p1", cfg));

	write_db("{ \"pools\": [ { \"id\": \"p1\", \"pool_type\": \"btc\", \"coin_daemon\": \"127.0.0.1\" } ] }");
	ASSERT_FALSE(db.get_pool_config("p1", cfg));

	write_db("{ \"pools\": [ { \"id\": \"p1\", \"pool_type\": \"btc\" }, { \"id\": \"p1\", \"pool_type\": \"ltc\" } ] }");
	ASSERT_FALSE(db.get_pool_ids(ids));

	write_db("{ \"pools\": [], \"workers\": [ { \"id\": \"1\", \"name\": \"alice\" } ] }");
	ASSERT_FALSE(db.get_pool_ids(ids));

	// Empty database is fine
	write_db("{}");
	ASSERT_TRUE(db.get_pool_ids(ids));
	ASSERT_TRUE(ids.empty());
}

TEST(worker_from_json, parse)
{
	Worker w;

	ASSERT_TRUE(worker_from_json("{\"id\":\"7\",\"name\":\"dave\",\"diff\":1000}", "p1", w));
	ASSERT_EQ(w.id, "7");
	ASSERT_EQ(w.name, "dave");
	ASSERT_EQ(w.pool_id, "p1");
	ASSERT_EQ(w.extra, "{\"diff\":1000}");

	ASSERT_TRUE(worker_from_json("{\"id\":\"7\",\"pool\":\"p2\",\"name\":\"dave\"}", "p1", w));
	ASSERT_EQ(w.pool_id, "p2");

	ASSERT_FALSE(worker_from_json("{\"id\":\"7\"}", "p1", w));
	ASSERT_FALSE(worker_from_json("{\"name\":\"dave\"}", "p1", w));
	ASSERT_FALSE(worker_from_json("{\"id\":\"7\",\"name\":\"dave\"}", "", w));
	ASSERT_FALSE(worker_from_json("[1,2,3]", "p1", w));
	ASSERT_FALSE(worker_from_json("{", "p1", w));
}

}

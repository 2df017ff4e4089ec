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
#include "coin_daemon.h"
#include "gtest/gtest.h"

namespace coinpool {

TEST(coin_daemon, types)
{
	const CoinDaemonType* btc = find_coin_daemon_type("btc");
	ASSERT_NE(btc, nullptr);
	ASSERT_STREQ(btc->pool_type, "btc");
	ASSERT_EQ(btc->default_rpc_port, 8332);

	const CoinDaemonType* ltc = find_coin_daemon_type("ltc");
	ASSERT_NE(ltc, nullptr);
	ASSERT_EQ(ltc->default_rpc_port, 9332);

	ASSERT_EQ(find_coin_daemon_type("doge"), nullptr);
	ASSERT_EQ(find_coin_daemon_type(""), nullptr);
}

TEST(coin_daemon, create)
{
	const CoinDaemonType* btc = find_coin_daemon_type("btc");
	ASSERT_NE(btc, nullptr);

	ICoinDaemon* d = ICoinDaemon::create(*btc, "p1", "{\"host\":\"127.0.0.1\",\"user\":\"rpc\",\"pass\":\"secret\"}");
	ASSERT_NE(d, nullptr);
	ASSERT_EQ(&d->type(), btc);

	CoinDaemonJSON_RPC* rpc = dynamic_cast<CoinDaemonJSON_RPC*>(d);
	ASSERT_NE(rpc, nullptr);
	ASSERT_EQ(rpc->host(), "127.0.0.1");
	ASSERT_EQ(rpc->port(), 8332);
	ASSERT_EQ(rpc->user(), "rpc");

	delete d;

	d = ICoinDaemon::create(*btc, "p1", "{\"host\":\"node\",\"port\":18332}");
	ASSERT_NE(d, nullptr);
	ASSERT_EQ(dynamic_cast<CoinDaemonJSON_RPC*>(d)->port(), 18332);
	delete d;
}

TEST(coin_daemon, invalid_config)
{
	const CoinDaemonType* ltc = find_coin_daemon_type("ltc");
	ASSERT_NE(ltc, nullptr);

	ASSERT_EQ(ICoinDaemon::create(*ltc, "p1", ""), nullptr);
	ASSERT_EQ(ICoinDaemon::create(*ltc, "p1", "[]"), nullptr);
	ASSERT_EQ(ICoinDaemon::create(*ltc, "p1", "{}"), nullptr);
	ASSERT_EQ(ICoinDaemon::create(*ltc, "p1", "{\"host\":\"\"}"), nullptr);
	ASSERT_EQ(ICoinDaemon::create(*ltc, "p1", "{\"host\":\"node\",\"port\":70000}"), nullptr);
	ASSERT_EQ(ICoinDaemon::create(*ltc, "p1", "{\"host\":\"node\",\"port\":\"9332\"}"), nullptr);
}

}

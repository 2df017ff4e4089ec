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
#include "params.h"
#include "gtest/gtest.h"

namespace coinpool {

template<size_t N>
static Params parse(const char* (&args)[N])
{
	return Params(static_cast<int>(N), const_cast<char**>(args));
}

TEST(params, defaults)
{
	const char* args[] = { "coinpool" };
	const Params p = parse(args);

	ASSERT_EQ(p.m_dbPath, "pools.json");
	ASSERT_TRUE(p.m_pools.empty());
	ASSERT_EQ(p.m_host, "0.0.0.0");
	ASSERT_EQ(p.m_maxRestarts, DEFAULT_MAX_RESTARTS);
	ASSERT_EQ(p.m_restartWindow, DEFAULT_RESTART_WINDOW);
	ASSERT_TRUE(p.valid());
}

TEST(params, options)
{
	const char* args[] = { "coinpool", "--db", "/etc/coinpool/pools.json", "--pool", "btc-main", "--pool", "ltc-main", "--pool", "btc-main", "--host", "::", "--max-restarts", "1000", "--restart-window", "0" };
	const Params p = parse(args);

	ASSERT_EQ(p.m_dbPath, "/etc/coinpool/pools.json");
	ASSERT_EQ(p.m_pools, (std::vector<std::string>{ "btc-main", "ltc-main" }));
	ASSERT_EQ(p.m_host, "::");
	ASSERT_EQ(p.m_maxRestarts, MAX_MAX_RESTARTS);
	ASSERT_EQ(p.m_restartWindow, 1U);
	ASSERT_TRUE(p.valid());
}

TEST(params, invalid)
{
	const char* args[] = { "coinpool", "--wallet", "x" };
	ASSERT_THROW(parse(args), std::exception);

	// Missing value
	const char* args2[] = { "coinpool", "--db" };
	ASSERT_THROW(parse(args2), std::exception);

	Params p;
	p.m_dbPath.clear();
	ASSERT_FALSE(p.valid());
}

}

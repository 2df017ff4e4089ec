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

namespace coinpool {

static constexpr uint32_t DEFAULT_MAX_RESTARTS = 5;
static constexpr uint32_t MAX_MAX_RESTARTS = 100;
static constexpr uint32_t DEFAULT_RESTART_WINDOW = 60;

struct Params
{
#ifdef COINPOOL_UNIT_TESTS
	FORCEINLINE Params() {}
#endif

	Params(int argc, char* argv[]);

	bool valid() const;

	std::string m_dbPath = "pools.json";

	// Pools to start, all pools from the database if empty
	std::vector<std::string> m_pools;

	std::string m_host = "0.0.0.0";
	uint32_t m_maxRestarts = DEFAULT_MAX_RESTARTS;
	uint32_t m_restartWindow = DEFAULT_RESTART_WINDOW;
};

} // namespace coinpool

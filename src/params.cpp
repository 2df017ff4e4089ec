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

LOG_CATEGORY(Params)

namespace coinpool {

Params::Params(int argc, char* argv[])
{
	for (int i = 1; i < argc; ++i) {
		bool ok = false;

		if ((strcmp(argv[i], "--db") == 0) && (i + 1 < argc)) {
			m_dbPath = argv[++i];
			ok = true;
		}

		if ((strcmp(argv[i], "--pool") == 0) && (i + 1 < argc)) {
			const char* id = argv[++i];
			if (std::find(m_pools.begin(), m_pools.end(), id) == m_pools.end()) {
				m_pools.emplace_back(id);
			}
			ok = true;
		}

		if ((strcmp(argv[i], "--host") == 0) && (i + 1 < argc)) {
			m_host = argv[++i];
			ok = true;
		}

		if ((strcmp(argv[i], "--max-restarts") == 0) && (i + 1 < argc)) {
			m_maxRestarts = std::min(static_cast<uint32_t>(std::max(strtol(argv[++i], nullptr, 10), 0L)), MAX_MAX_RESTARTS);
			ok = true;
		}

		if ((strcmp(argv[i], "--restart-window") == 0) && (i + 1 < argc)) {
			m_restartWindow = static_cast<uint32_t>(std::min(std::max(strtoul(argv[++i], nullptr, 10), 1UL), 86400UL));
			ok = true;
		}

		if ((strcmp(argv[i], "--loglevel") == 0) && (i + 1 < argc)) {
			const int level = std::min(std::max<int>(static_cast<int>(strtol(argv[++i], nullptr, 10)), 0), log::MAX_GLOBAL_LOG_LEVEL);
			log::GLOBAL_LOG_LEVEL = level;
			ok = true;
		}

		if (strcmp(argv[i], "--no-color") == 0) {
			log::CONSOLE_COLORS = false;
			ok = true;
		}

		if (!ok) {
			fprintf(stderr, "Unknown or invalid command line parameter \"%s\"\n\n", argv[i]);
			coinpool_usage();
			throw std::exception();
		}
	}
}

bool Params::valid() const
{
	if (m_dbPath.empty()) {
		LOGERR(1, "Pool database path is empty");
		return false;
	}

	if (m_host.empty()) {
		LOGERR(1, "Listen address is empty");
		return false;
	}

	return true;
}

} // namespace coinpool

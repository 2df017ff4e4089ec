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
#include "coinpool.h"
#include "params.h"

void coinpool_usage()
{
	printf("coinpool %s\n"
		"\nUsage:\n\n" \
		"--db                 Path to the JSON pool database with pool configs and workers, default is %s\n"
		"--pool               Id of a pool to start, can be repeated. All pools from the database are started if none is given\n"
		"--host               IP address to bind pool RPC listeners to, default is %s\n"
		"--max-restarts N     Maximum number of pool restarts within the restart window before a pool stays down (any value between 0 and %u), default is %u\n"
		"--restart-window N   Restart window in seconds (any value between 1 and 86400), default is %u\n"
		"--loglevel           Verbosity of the log, integer number between 0 and %d\n"
		"--no-color           Disable colors in console output\n"
		"--version            Print coinpool's version and build details\n"
		"--help               Show this help message\n\n"
		"Example command line:\n\n"
		"%s --db pools.json --pool btc-main --pool ltc-main --host 0.0.0.0\n\n",
		coinpool::VERSION,
		"pools.json",
		"0.0.0.0",
		coinpool::MAX_MAX_RESTARTS,
		coinpool::DEFAULT_MAX_RESTARTS,
		coinpool::DEFAULT_RESTART_WINDOW,
		coinpool::log::MAX_GLOBAL_LOG_LEVEL,
		"./coinpool"
	);
}

void coinpool_version()
{
	printf("coinpool %s\n", coinpool::VERSION);
}

int main(int argc, char* argv[])
{
	for (int i = 1; i < argc; ++i) {
		if (!strcmp(argv[i], "--help") || !strcmp(argv[i], "-h")) {
			coinpool_usage();
			return 0;
		}

		if (!strcmp(argv[i], "--version") || !strcmp(argv[i], "-v")) {
			coinpool_version();
			return 0;
		}
	}

	coinpool::log::start();

	int result;

	try {
		coinpool::coinpool pool(argc, argv);
		result = pool.run();
	}
	catch (const std::exception&) {
		result = 1;
	}

	coinpool::log::stop();

	return result;
}
